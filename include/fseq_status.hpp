//
//  fseq_status.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace fseqforge {

/// Failure conditions reported by the encoder, codec, reader and merger.
enum class FseqErrc {
    None = 0,
    UnsupportedSampleWidth,    ///< Source PCM bit depth outside {8,16,24,32}.
    MissingDecoderDependency,  ///< Non-WAV input and no ffmpeg available.
    NotAnFseqFile,             ///< Bad magic or header too short.
    UnsupportedCompression,    ///< Merge target carries a compressed payload.
    UnsupportedVersion,        ///< Merge target is not FSEQ v2.
    TruncatedChannelData,      ///< Channel region shorter than the header declares.
    InvalidFrameRate,          ///< Step time / sample rate yield no samples per frame.
    FrameSizeMismatch,         ///< Frame length differs from the declared channel count.
    IoError,                   ///< Open/read/write/rename failure.
    InvalidAudio,              ///< Malformed or undecodable audio input.
    InvalidConfig,             ///< Malformed options file.
    ChannelOffsetOverflow,     ///< start channel + audio width exceeds 32 bits.
};

/// Short stable name for an error code (e.g. "NotAnFseqFile").
const char *errc_name(FseqErrc code);

/**
 * @brief Result object with success flag, error code and message.
 *
 * When `ok == true`, `code` is `None` and `message` is empty. On failure `message` names the
 * condition and the offending value (detected magic, version, sizes).
 */
struct Status {
    bool ok{false};
    FseqErrc code{FseqErrc::None};
    std::string message;
};

inline Status ok_status() { return Status{true, FseqErrc::None, {}}; }

inline Status make_error(FseqErrc code, std::string msg) {
    return Status{false, code, std::move(msg)};
}

}  // namespace fseqforge
