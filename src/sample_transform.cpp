//
//  sample_transform.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sample_transform.hpp"

#include <algorithm>

#include "logging.hpp"

namespace {

constexpr double kInt16Min = -32768.0;
constexpr double kInt16Max = 32767.0;

}  // namespace

namespace fseqforge {

SampleBuffer to_mono(const SampleBuffer &in) {
    if (in.channels <= 1) {
        return in;
    }
    SampleBuffer out;
    out.sample_rate = in.sample_rate;
    out.channels = 1;
    out.samples.reserve(in.samples.size() / in.channels + 1);

    const size_t n = in.samples.size();
    for (size_t i = 0; i < n; i += in.channels) {
        const size_t group = std::min<size_t>(in.channels, n - i);
        int32_t sum = 0;
        for (size_t c = 0; c < group; ++c) {
            sum += in.samples[i + c];
        }
        // Integer division truncates toward zero.
        out.samples.push_back(static_cast<int16_t>(sum / static_cast<int32_t>(group)));
    }
    FF_LOG("debug", "to_mono: " << in.channels << "ch " << in.frame_count() << " frames -> "
                                << out.samples.size() << " samples");
    return out;
}

SampleBuffer resample_linear(const SampleBuffer &in, uint32_t dst_rate) {
    if (in.sample_rate == dst_rate) {
        return in;
    }
    if (in.sample_rate == 0 || dst_rate == 0 || in.channels == 0) {
        FF_LOG("warn", "resample_linear: invalid rates " << in.sample_rate << " -> " << dst_rate
                                                         << ", leaving samples untouched");
        return in;
    }

    const uint32_t src_rate = in.sample_rate;
    const size_t channels = in.channels;
    const size_t in_frames = in.frame_count();
    const size_t out_frames = static_cast<size_t>(static_cast<uint64_t>(in_frames) * dst_rate /
                                                  src_rate);
    const double ratio = static_cast<double>(src_rate) / static_cast<double>(dst_rate);

    SampleBuffer out;
    out.sample_rate = dst_rate;
    out.channels = in.channels;
    out.samples.resize(out_frames * channels);

    // Channels are interpolated independently and re-interleaved.
    for (size_t c = 0; c < channels; ++c) {
        auto at = [&](size_t frame) -> double {
            return static_cast<double>(in.samples[frame * channels + c]);
        };
        for (size_t i = 0; i < out_frames; ++i) {
            const double src_pos = static_cast<double>(i) * ratio;
            const size_t idx = static_cast<size_t>(src_pos);
            const double frac = src_pos - static_cast<double>(idx);
            double val;
            if (idx + 1 < in_frames) {
                val = at(idx) * (1.0 - frac) + at(idx + 1) * frac;
            } else {
                val = at(std::min(idx, in_frames - 1));
            }
            val = std::clamp(val, kInt16Min, kInt16Max);
            out.samples[i * channels + c] = static_cast<int16_t>(static_cast<int32_t>(val));
        }
    }
    FF_LOG("debug", "resample_linear: " << src_rate << "Hz -> " << dst_rate << "Hz, "
                                        << in_frames << " -> " << out_frames << " frames");
    return out;
}

}  // namespace fseqforge
