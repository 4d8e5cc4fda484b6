//
//  fseq_status.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fseq_status.hpp"

namespace fseqforge {

const char *errc_name(FseqErrc code) {
    switch (code) {
        case FseqErrc::None:
            return "None";
        case FseqErrc::UnsupportedSampleWidth:
            return "UnsupportedSampleWidth";
        case FseqErrc::MissingDecoderDependency:
            return "MissingDecoderDependency";
        case FseqErrc::NotAnFseqFile:
            return "NotAnFseqFile";
        case FseqErrc::UnsupportedCompression:
            return "UnsupportedCompression";
        case FseqErrc::UnsupportedVersion:
            return "UnsupportedVersion";
        case FseqErrc::TruncatedChannelData:
            return "TruncatedChannelData";
        case FseqErrc::InvalidFrameRate:
            return "InvalidFrameRate";
        case FseqErrc::FrameSizeMismatch:
            return "FrameSizeMismatch";
        case FseqErrc::IoError:
            return "IoError";
        case FseqErrc::InvalidAudio:
            return "InvalidAudio";
        case FseqErrc::InvalidConfig:
            return "InvalidConfig";
        case FseqErrc::ChannelOffsetOverflow:
            return "ChannelOffsetOverflow";
    }
    return "Unknown";
}

}  // namespace fseqforge
