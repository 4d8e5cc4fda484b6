//
//  sample_buffer.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Decoded 16-bit PCM, interleaved.
 *
 * `samples.size()` is a multiple of `channels`.
 */
struct SampleBuffer {
    std::vector<int16_t> samples;  ///< Interleaved signed samples
    uint32_t sample_rate = 0;      ///< Hz
    uint16_t channels = 0;         ///< 1 = mono, 2 = stereo

    /// Number of sample frames (one sample per channel).
    size_t frame_count() const { return channels == 0 ? 0 : samples.size() / channels; }
};
