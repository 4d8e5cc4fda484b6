//
//  frame_encoder.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "frame_encoder.hpp"

#include <string>
#include <utility>

#include "byte_io.hpp"
#include "logging.hpp"

namespace fseqforge {

Status compute_samples_per_frame(uint32_t sample_rate, uint32_t step_time_ms,
                                 uint32_t &samples_per_frame) {
    const uint64_t spf = static_cast<uint64_t>(sample_rate) * step_time_ms / 1000;
    if (spf == 0 || spf > 0xFFFFFFFFULL) {
        return make_error(FseqErrc::InvalidFrameRate,
                          "samples per frame is " + std::to_string(spf) + " for " +
                              std::to_string(sample_rate) + "Hz at " +
                              std::to_string(step_time_ms) + "ms step");
    }
    samples_per_frame = static_cast<uint32_t>(spf);
    return ok_status();
}

uint32_t frame_width(uint32_t samples_per_frame, uint16_t channels) {
    return kSyncMarkerSize + samples_per_frame * 2u * channels;
}

Status encode_frames(const SampleBuffer &samples, uint32_t samples_per_frame,
                     std::vector<Frame> &frames) {
    if (samples_per_frame == 0) {
        return make_error(FseqErrc::InvalidFrameRate, "samples per frame must be positive");
    }
    const uint16_t channels = samples.channels == 0 ? 1 : samples.channels;
    const uint32_t width = frame_width(samples_per_frame, channels);
    const size_t values_per_frame = static_cast<size_t>(samples_per_frame) * channels;
    const size_t total = samples.samples.size();
    const size_t frame_count = (total + values_per_frame - 1) / values_per_frame;

    frames.clear();
    frames.reserve(frame_count);
    for (size_t f = 0; f < frame_count; ++f) {
        Frame frame;
        frame.reserve(width);
        write_u8(frame, kSyncMarkerHigh);
        write_u8(frame, kSyncMarkerLow);

        const size_t start = f * values_per_frame;
        for (size_t i = 0; i < values_per_frame; ++i) {
            const size_t src = start + i;
            // Past the end: silence.
            const int16_t s = src < total ? samples.samples[src] : int16_t{0};
            write_be16(frame, static_cast<uint16_t>(s));
        }

        if (frame.size() != width) {
            return make_error(FseqErrc::FrameSizeMismatch,
                              "frame " + std::to_string(f) + " is " +
                                  std::to_string(frame.size()) + " bytes, expected " +
                                  std::to_string(width));
        }
        frames.emplace_back(std::move(frame));
    }
    FF_LOG("debug", "encode_frames: " << total << " samples, " << samples_per_frame
                                      << " per frame x " << channels << "ch -> "
                                      << frames.size() << " frames of " << width << " bytes");
    return ok_status();
}

}  // namespace fseqforge
