//
//  fseq_merger.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fseq_merger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include "fseq_reader.hpp"
#include "fseq_writer.hpp"
#include "logging.hpp"

namespace fseqforge {

namespace {

// Fill `row` (already sized to total channels) for output frame `f`.
void compose_row(uint32_t f, const MergeLayout &layout,
                 const std::vector<uint8_t> &light_grid, const std::vector<Frame> &audio_frames,
                 std::vector<uint8_t> &row) {
    std::fill(row.begin(), row.end(), 0);
    if (f < layout.light_frames && layout.light_channels > 0) {
        const size_t src = static_cast<size_t>(f) * layout.light_channels;
        std::memcpy(row.data(), light_grid.data() + src, layout.light_channels);
    }
    if (f < layout.audio_frames && layout.audio_channels > 0) {
        // Audio overwrites any light bytes in its span.
        std::memcpy(row.data() + layout.start_channel, audio_frames[f].data(),
                    layout.audio_channels);
    }
}

}  // namespace

Status validate_merge_target(const FseqHeader &header) {
    if (header.compression != 0) {
        return make_error(FseqErrc::UnsupportedCompression,
                          "Cannot merge into compressed FSEQ files (compression type " +
                              std::to_string(header.compression) + "). Decompress first.");
    }
    if (header.major_version != kFseqMajorVersion) {
        return make_error(FseqErrc::UnsupportedVersion,
                          "Only FSEQ v2 supported, got v" +
                              std::to_string(header.major_version) + "." +
                              std::to_string(header.minor_version));
    }
    return ok_status();
}

Status merge_into_fseq(const std::vector<Frame> &audio_frames, uint32_t audio_channels_per_frame,
                       const std::string &existing_path, uint32_t start_channel,
                       const std::string &output_path, MergeResult &result) {
    FseqHeader light{};
    Status st = read_header(existing_path, light);
    if (!st.ok) {
        return st;
    }
    st = validate_merge_target(light);
    if (!st.ok) {
        return st;
    }

    MergeLayout layout;
    layout.start_channel = start_channel;
    layout.light_channels = light.channel_count;
    layout.light_frames = light.frame_count;
    layout.audio_channels = audio_channels_per_frame;
    layout.audio_frames = static_cast<uint32_t>(audio_frames.size());

    if (layout.total_channels() > 0xFFFFFFFFULL) {
        return make_error(FseqErrc::ChannelOffsetOverflow,
                          "start channel " + std::to_string(start_channel) + " + " +
                              std::to_string(audio_channels_per_frame) +
                              " audio channels exceeds the 32-bit channel count");
    }
    for (size_t i = 0; i < audio_frames.size(); ++i) {
        if (audio_frames[i].size() != audio_channels_per_frame) {
            return make_error(FseqErrc::FrameSizeMismatch,
                              "Frame size mismatch at audio frame " + std::to_string(i) + ": " +
                                  std::to_string(audio_frames[i].size()) +
                                  " != " + std::to_string(audio_channels_per_frame));
        }
    }

    std::vector<uint8_t> light_grid;
    st = read_channel_data(existing_path, light, light_grid);
    if (!st.ok) {
        return st;
    }

    const uint32_t total_channels = static_cast<uint32_t>(layout.total_channels());
    const uint32_t total_frames = layout.total_frames();
    FF_LOG("info", "Light sequence: " << layout.light_channels << " ch x " << layout.light_frames
                                      << " frames");
    FF_LOG("info", "Audio data: " << layout.audio_channels << " ch x " << layout.audio_frames
                                  << " frames @ ch " << layout.start_channel);
    FF_LOG("info", "Merged output: " << total_channels << " ch x " << total_frames << " frames");
    if (layout.overlaps()) {
        const uint64_t audio_end = uint64_t(layout.start_channel) + layout.audio_channels;
        FF_LOG("warn", "audio channels [" << layout.start_channel << ", " << audio_end
                                          << ") overlap light channels [0, "
                                          << layout.light_channels
                                          << "); audio bytes replace light data there");
    }

    const std::vector<VariableHeaderRecord> records = {
        make_text_record(kTagMediaFile, kMergedMediaName),
        make_text_record(kTagSource, encoder_id()),
    };
    const auto variable_header = encode_variable_header(records);
    const FseqHeader header =
        make_header(total_channels, total_frames, light.step_time_ms, variable_header.size());

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        const int err = errno;
        return make_error(FseqErrc::IoError, "open failed for " + output_path + " (" +
                                                 std::generic_category().message(err) + ")");
    }
    write_preamble(out, header, variable_header);

    std::vector<uint8_t> row(total_channels);
    for (uint32_t f = 0; f < total_frames; ++f) {
        compose_row(f, layout, light_grid, audio_frames, row);
        out.write(reinterpret_cast<const char *>(row.data()),
                  static_cast<std::streamsize>(row.size()));
    }
    out.flush();
    if (!out.good()) {
        return make_error(FseqErrc::IoError, "write failed for " + output_path);
    }

    result.total_channels = total_channels;
    result.total_frames = total_frames;
    result.total_size = static_cast<uint64_t>(header.data_offset) +
                        static_cast<uint64_t>(total_frames) * total_channels;
    return ok_status();
}

#ifdef FSEQFORGE_TESTING
namespace testing {
std::vector<uint8_t> compose_merged_row_for_test(uint32_t frame_index,
                                                 const MergeLayout &layout,
                                                 const std::vector<uint8_t> &light_grid,
                                                 const std::vector<Frame> &audio_frames) {
    std::vector<uint8_t> row(static_cast<size_t>(layout.total_channels()));
    compose_row(frame_index, layout, light_grid, audio_frames, row);
    return row;
}
}  // namespace testing
#endif

}  // namespace fseqforge
