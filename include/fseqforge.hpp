//
//  fseqforge.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fseq_header.hpp"
#include "fseq_merger.hpp"
#include "fseq_status.hpp"

namespace fseqforge {

/// @defgroup api FseqForge Public API
/// Public, supported C++ interfaces for encoding audio into FSEQ v2 channel data.
/// @{

inline constexpr uint32_t kDefaultFps = 40;
inline constexpr uint32_t kDefaultSampleRate = 44100;
inline constexpr uint32_t kMaxStepTimeMs = 255;  // u8 header field

/**
 * @brief Encoder settings; defaults match the command line.
 */
struct EncodeOptions {
    uint32_t fps = kDefaultFps;                 ///< Used when step_time_ms is unset
    std::optional<uint32_t> step_time_ms;       ///< Overrides fps
    uint32_t sample_rate = kDefaultSampleRate;  ///< Output sample rate (Hz)
    std::string merge_path;                     ///< Existing FSEQ to merge into (empty: standalone)
    uint32_t start_channel = kDefaultStartChannel;  ///< Merge channel offset (0-based)
    bool stereo = false;                        ///< Keep two channels instead of mixing to mono
    std::string ffmpeg_path;                    ///< ffmpeg binary for non-WAV input (empty: PATH)
    bool atomic_write = true;                   ///< Write <output>.tmp and rename on success
};

/**
 * @brief Outcome of an encode, with the numbers the CLI reports.
 *
 * `channels_per_frame` is the audio block width. For a standalone file it equals the file's
 * channel count; for a merge `total_channels`/`total_frames` describe the merged grid.
 */
struct EncodeResult {
    Status status;
    bool merged = false;
    uint8_t step_time_ms = 0;
    uint32_t samples_per_frame = 0;
    uint16_t audio_channels = 0;
    uint32_t channels_per_frame = 0;
    uint32_t frame_count = 0;
    uint32_t total_channels = 0;
    uint32_t total_frames = 0;
    uint64_t total_size = 0;
    std::vector<uint8_t> first_frame;  ///< First encoded frame (for the verbose dump)
};

/// Header and metadata records of an existing FSEQ file.
struct ReadResult {
    Status status;
    FseqHeader header;
    std::vector<VariableHeaderRecord> records;
};

/// Library version string (e.g. `v0.3` or `v0.3+abcd123`).
std::string version_string();  ///< @ingroup api

/// Step time for the options: explicit step time, else 1000 / fps (1..255 ms).
Status resolve_step_time(const EncodeOptions &options, uint8_t &step_time_ms);  ///< @ingroup api

/**
 * @brief Decode `input_audio_path`, encode it into frames and write `output_path`.
 *
 * Standalone when `options.merge_path` is empty, otherwise merges the audio at
 * `options.start_channel` into the existing file.
 */
EncodeResult encode_file_to_fseq(const std::string &input_audio_path,
                                 const std::string &output_path,
                                 const EncodeOptions &options = {});  ///< @ingroup api

/// Read the fixed header and the variable header records of an FSEQ file.
ReadResult read_fseq(const std::string &path);  ///< @ingroup api

/**
 * @brief Apply a JSON options file on top of `options`.
 *
 * Recognized keys: `fps`, `step_time_ms`, `sample_rate`, `merge`, `start_channel`, `stereo`,
 * `ffmpeg`. Unknown keys are ignored. A relative `merge` path resolves against the directory
 * of the JSON file.
 */
Status load_options_json(const std::string &json_path, EncodeOptions &options);  ///< @ingroup api

/// @}

}  // namespace fseqforge
