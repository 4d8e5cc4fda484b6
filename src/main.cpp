//
//  main.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fseqforge.hpp"
#include "fseqforge_version.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

constexpr size_t kVerboseDumpBytes = 32;

bool parse_u32(const std::string &s, uint32_t &out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        const unsigned long long v = std::stoull(s);
        if (v > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::out_of_range &) {
        return false;
    }
}

void print_usage() {
    std::cerr << "FseqForge " << FSEQFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for reading:\n"
              << "  fseqforge <input.fseq> [--log-level warn|info|debug]\n"
              << "usage for encoding:\n"
              << "  fseqforge <input.wav|input.mp3> <output.fseq> [options]\n"
              << "  fseqforge <input.wav|input.mp3> -o <output.fseq> [options]\n"
              << "Options:\n"
              << "  --fps N             Frame rate in fps (default: 40). Determines step time.\n"
              << "  --step-time MS      Step time in ms (overrides --fps).\n"
              << "  --sample-rate HZ    Output sample rate in Hz (default: 44100).\n"
              << "  --merge FILE        Existing .fseq to merge audio into (at --start-channel).\n"
              << "  --start-channel N   Channel offset for merged mode (default: 500000).\n"
              << "  --stereo            Keep stereo (default is mono to save channels).\n"
              << "  --ffmpeg PATH       ffmpeg binary used to decode non-WAV input.\n"
              << "  --config FILE       JSON options file; command line options win.\n"
              << "  --no-atomic         Write the output in place instead of via a temp file.\n"
              << "  -v, --verbose       Debug logging and a hex dump of the first frame.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version           Print the version.\n";
}

bool emit_json(const fseqforge::ReadResult &res) {
    const auto &h = res.header;
    nlohmann::json j;
    j["version"] = std::to_string(h.major_version) + "." + std::to_string(h.minor_version);
    j["data_offset"] = h.data_offset;
    j["variable_header_offset"] = h.var_header_offset;
    j["channel_count"] = h.channel_count;
    j["frame_count"] = h.frame_count;
    j["step_time_ms"] = h.step_time_ms;
    j["flags"] = h.flags;
    j["compression"] = h.compression;
    j["compression_blocks"] = h.compression_blocks;
    j["sparse_ranges"] = h.sparse_ranges;
    j["unique_id"] = h.unique_id;
    if (h.step_time_ms > 0) {
        j["duration_ms"] = static_cast<uint64_t>(h.frame_count) * h.step_time_ms;
    }

    nlohmann::json records = nlohmann::json::object();
    for (const auto &r : res.records) {
        records[r.code_string()] = r.text();
    }
    j["variable_headers"] = records;

    std::cout << j.dump(2) << "\n";
    return true;
}

// Channel output snippet for co-other.json; startChannel is 1-based.
void emit_display_hint(const fseqforge::EncodeResult &res, uint32_t start_channel) {
    nlohmann::json output;
    output["type"] = "HTTPVirtualDisplay";
    output["enabled"] = 1;
    output["startChannel"] = res.merged ? static_cast<uint64_t>(start_channel) + 1 : 1;
    output["channelCount"] = res.channels_per_frame;
    nlohmann::json j;
    j["channelOutputs"] = nlohmann::json::array({output});
    std::cout << "Add to co-other.json: " << j.dump() << "\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && std::string(argv[1]) == "--version") {
        std::cout << "FseqForge " << FSEQFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Options given on the command line; applied on top of --config.
    std::vector<std::string> positional;
    std::string output_path;
    std::string config_path;
    bool verbose = false;
    bool no_atomic = false;
    bool stereo = false;
    std::optional<uint32_t> fps, step_time, sample_rate, start_channel;
    std::optional<std::string> merge_path, ffmpeg_path;

    auto need_u32 = [&](int &i, const std::string &arg, std::optional<uint32_t> &dst) {
        uint32_t v = 0;
        if (i + 1 >= argc || !parse_u32(argv[i + 1], v)) {
            std::cerr << "Option " << arg << " needs an unsigned integer\n";
            return false;
        }
        dst = v;
        ++i;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " needs a path\n";
                return 2;
            }
            output_path = argv[++i];
        } else if (arg == "--fps") {
            if (!need_u32(i, arg, fps)) return 2;
        } else if (arg == "--step-time") {
            if (!need_u32(i, arg, step_time)) return 2;
        } else if (arg == "--sample-rate") {
            if (!need_u32(i, arg, sample_rate)) return 2;
        } else if (arg == "--start-channel") {
            if (!need_u32(i, arg, start_channel)) return 2;
        } else if (arg == "--merge" && i + 1 < argc) {
            merge_path = argv[++i];
        } else if (arg == "--ffmpeg" && i + 1 < argc) {
            ffmpeg_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--stereo") {
            stereo = true;
        } else if (arg == "--no-atomic") {
            no_atomic = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            fseqforge::set_log_verbosity(fseqforge::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }
    if (verbose) {
        fseqforge::set_log_verbosity(fseqforge::LogVerbosity::Debug);
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }
    if (output_path.empty() && positional.size() == 2) {
        output_path = positional[1];
        positional.pop_back();
    }
    if (positional.size() != 1) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }
    const std::string input_path = positional[0];

    try {
        // Reading mode: a single FSEQ file and no output.
        if (output_path.empty()) {
            auto res = fseqforge::read_fseq(input_path);
            if (!res.status.ok) {
                FF_LOG("error", "fseqforge: failed to read fseq ("
                                    << fseqforge::errc_name(res.status.code)
                                    << "): " << res.status.message);
                return 1;
            }
            return emit_json(res) ? 0 : 1;
        }

        fseqforge::EncodeOptions options;
        if (!config_path.empty()) {
            auto st = fseqforge::load_options_json(config_path, options);
            if (!st.ok) {
                FF_LOG("error", "fseqforge: failed to load options ("
                                    << fseqforge::errc_name(st.code) << "): " << st.message);
                return 2;
            }
        }
        if (fps) options.fps = *fps;
        if (step_time) options.step_time_ms = *step_time;
        if (sample_rate) options.sample_rate = *sample_rate;
        if (start_channel) options.start_channel = *start_channel;
        if (merge_path) options.merge_path = *merge_path;
        if (ffmpeg_path) options.ffmpeg_path = *ffmpeg_path;
        if (stereo) options.stereo = true;
        if (no_atomic) options.atomic_write = false;

        auto res = fseqforge::encode_file_to_fseq(input_path, output_path, options);
        if (!res.status.ok) {
            FF_LOG("error", "fseqforge: failed to encode ("
                                << fseqforge::errc_name(res.status.code)
                                << "): " << res.status.message);
            return 1;
        }

        std::cout << "Wrote " << (res.merged ? "merged" : "standalone")
                  << " FSEQ: " << output_path << "\n"
                  << "  Size: " << res.total_size << " bytes ("
                  << (static_cast<double>(res.total_size) / 1024.0 / 1024.0) << " MB)\n";
        if (res.merged) {
            std::cout << "  Channels: " << res.total_channels << ", Frames: " << res.total_frames
                      << "\n";
        }
        emit_display_hint(res, options.start_channel);

        if (verbose) {
            FF_LOG("debug", "First frame hex dump (first " << kVerboseDumpBytes << " bytes): "
                                                           << fseqforge::hex_prefix(
                                                                  res.first_frame,
                                                                  kVerboseDumpBytes));
        }
    } catch (const std::exception &e) {
        FF_LOG("error", "fseqforge: " << e.what());
        return 1;
    }
    return 0;
}
