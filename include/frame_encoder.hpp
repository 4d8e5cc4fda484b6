//
//  frame_encoder.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "fseq_status.hpp"
#include "sample_buffer.hpp"

namespace fseqforge {

// One FSEQ row of channel bytes.
using Frame = std::vector<uint8_t>;

// Prefix of every audio frame; a renderer scans for it to find sample boundaries.
inline constexpr uint8_t kSyncMarkerHigh = 0xAA;
inline constexpr uint8_t kSyncMarkerLow = 0x55;
inline constexpr uint32_t kSyncMarkerSize = 2;

// floor(sample_rate * step_time_ms / 1000). Zero is rejected with InvalidFrameRate.
Status compute_samples_per_frame(uint32_t sample_rate, uint32_t step_time_ms,
                                 uint32_t &samples_per_frame);

// Channel bytes per frame: sync marker + 2 bytes per sample per audio channel.
uint32_t frame_width(uint32_t samples_per_frame, uint16_t channels);

/**
 * @brief Split samples into sync-marked frames of `samples_per_frame` sample frames each.
 *
 * Samples are written high byte first as their unsigned 16-bit representation. The final frame
 * is padded with silence. An empty buffer produces no frames.
 *
 * @return InvalidFrameRate for `samples_per_frame == 0`, FrameSizeMismatch if a produced frame
 *         does not match `frame_width()`.
 */
Status encode_frames(const SampleBuffer &samples, uint32_t samples_per_frame,
                     std::vector<Frame> &frames);

}  // namespace fseqforge
