//
//  audio_decoder.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fseq_status.hpp"
#include "sample_buffer.hpp"

namespace fseqforge {

// Source of decoded 16-bit PCM for the encoder.
class AudioDecoder {
   public:
    virtual ~AudioDecoder() = default;

    virtual const char *name() const = 0;

    // Decode the whole file into `out` (interleaved, native channel count and rate).
    virtual Status decode(const std::string &path, SampleBuffer &out) = 0;
};

using AudioDecoderPtr = std::unique_ptr<AudioDecoder>;

// Native RIFF/WAVE PCM decoder (8/16/24/32-bit integer samples).
class WavDecoder : public AudioDecoder {
   public:
    const char *name() const override { return "wav"; }
    Status decode(const std::string &path, SampleBuffer &out) override;
};

// Delegates container decoding to an ffmpeg binary that writes 16-bit WAV to a pipe.
class FfmpegDecoder : public AudioDecoder {
   public:
    // Empty `ffmpeg_path`: search PATH for "ffmpeg".
    explicit FfmpegDecoder(std::string ffmpeg_path = {}) : ffmpeg_path_(std::move(ffmpeg_path)) {}

    const char *name() const override { return "ffmpeg"; }
    Status decode(const std::string &path, SampleBuffer &out) override;

    // Resolved executable, or empty when none is available.
    std::string locate() const;

   private:
    std::string ffmpeg_path_;
};

// Parse a complete RIFF/WAVE image. A data chunk claiming more bytes than present (streamed
// output) is clamped to what is there.
Status decode_wav_bytes(const std::vector<uint8_t> &bytes, SampleBuffer &out);

// .wav/.wave (any case) -> WavDecoder; anything else -> FfmpegDecoder.
AudioDecoderPtr make_decoder_for(const std::string &path, const std::string &ffmpeg_path = {});

}  // namespace fseqforge
