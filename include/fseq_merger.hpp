//
//  fseq_merger.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "frame_encoder.hpp"
#include "fseq_header.hpp"
#include "fseq_status.hpp"

namespace fseqforge {

// Far above typical lighting channel counts.
inline constexpr uint32_t kDefaultStartChannel = 500000;
// Media name recorded in the variable header of a merged file.
inline constexpr char kMergedMediaName[] = "merged";

// Dimensions of one merge: the light grid read from disk and the audio grid being overlaid.
struct MergeLayout {
    uint32_t start_channel = kDefaultStartChannel;
    uint32_t light_channels = 0;
    uint32_t light_frames = 0;
    uint32_t audio_channels = 0;
    uint32_t audio_frames = 0;

    uint32_t total_frames() const { return std::max(light_frames, audio_frames); }
    // 64-bit so callers can detect a start channel that overflows the header field.
    uint64_t total_channels() const {
        return std::max<uint64_t>(light_channels,
                                  static_cast<uint64_t>(start_channel) + audio_channels);
    }
    bool overlaps() const { return audio_channels > 0 && start_channel < light_channels; }
};

struct MergeResult {
    uint64_t total_size = 0;
    uint32_t total_channels = 0;
    uint32_t total_frames = 0;
};

// Reject merge targets that cannot be byte-sliced: compressed payloads and non-v2 files.
Status validate_merge_target(const FseqHeader &header);

/**
 * @brief Overlay encoded audio frames onto the channel grid of an existing FSEQ v2 file.
 *
 * The output grid is max(light, audio) frames by max(light channels, start_channel + audio
 * width) channels. Light rows land at channel 0, audio rows at `start_channel`; where the two
 * overlap the audio bytes win. All checks run before `output_path` is opened, so the output
 * may name the existing file.
 */
Status merge_into_fseq(const std::vector<Frame> &audio_frames, uint32_t audio_channels_per_frame,
                       const std::string &existing_path, uint32_t start_channel,
                       const std::string &output_path, MergeResult &result);

#ifdef FSEQFORGE_TESTING
namespace testing {
// Build output row `frame_index` of a merge.
std::vector<uint8_t> compose_merged_row_for_test(uint32_t frame_index,
                                                 const MergeLayout &layout,
                                                 const std::vector<uint8_t> &light_grid,
                                                 const std::vector<Frame> &audio_frames);
}  // namespace testing
#endif

}  // namespace fseqforge
