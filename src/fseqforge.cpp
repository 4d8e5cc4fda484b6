//
//  fseqforge.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "fseqforge.hpp"
#include "fseqforge_version.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "audio_decoder.hpp"
#include "frame_encoder.hpp"
#include "fseq_merger.hpp"
#include "fseq_reader.hpp"
#include "fseq_writer.hpp"
#include "logging.hpp"
#include "sample_transform.hpp"

using json = nlohmann::json;

namespace fseqforge {

std::string version_string() { return FSEQFORGE_VERSION_DISPLAY; }

}  // namespace fseqforge

namespace {

using fseqforge::FseqErrc;
using fseqforge::make_error;
using fseqforge::Status;

constexpr const char *kTempSuffix = ".tmp";

double elapsed_ms(std::chrono::steady_clock::time_point from,
                  std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

// Move the finished temporary over the destination.
Status commit_output(const std::string &tmp_path, const std::string &output_path) {
    std::error_code ec;
    std::filesystem::rename(tmp_path, output_path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return make_error(FseqErrc::IoError,
                          "rename " + tmp_path + " -> " + output_path + " failed (" +
                              ec.message() + ")");
    }
    return fseqforge::ok_status();
}

void discard_output(const std::string &tmp_path) {
    std::error_code ec;
    if (std::filesystem::remove(tmp_path, ec)) {
        FF_LOG("debug", "removed incomplete " << tmp_path);
    }
}

Status read_u32_option(const json &j, const char *key, uint32_t &out) {
    if (!j.contains(key)) {
        return fseqforge::ok_status();
    }
    const auto &v = j.at(key);
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFFFFFFFFULL) {
        return make_error(FseqErrc::InvalidConfig,
                          std::string("option '") + key + "' must be an unsigned 32-bit integer");
    }
    out = v.get<uint32_t>();
    return fseqforge::ok_status();
}

}  // namespace

namespace fseqforge {

Status resolve_step_time(const EncodeOptions &options, uint8_t &step_time_ms) {
    uint32_t step = 0;
    if (options.step_time_ms) {
        step = *options.step_time_ms;
    } else {
        if (options.fps == 0) {
            return make_error(FseqErrc::InvalidFrameRate, "frame rate must be positive");
        }
        step = 1000 / options.fps;
    }
    if (step == 0 || step > kMaxStepTimeMs) {
        return make_error(FseqErrc::InvalidFrameRate,
                          "step time " + std::to_string(step) + "ms outside 1.." +
                              std::to_string(kMaxStepTimeMs));
    }
    step_time_ms = static_cast<uint8_t>(step);
    return ok_status();
}

EncodeResult encode_file_to_fseq(const std::string &input_audio_path,
                                 const std::string &output_path, const EncodeOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    EncodeResult res;
    res.merged = !options.merge_path.empty();

    res.status = resolve_step_time(options, res.step_time_ms);
    if (!res.status.ok) {
        return res;
    }
    if (options.sample_rate == 0) {
        res.status = make_error(FseqErrc::InvalidFrameRate, "sample rate must be positive");
        return res;
    }

    FF_LOG("info", "Audio-to-FSEQ Encoder");
    FF_LOG("info", "  Input:       " << input_audio_path);
    FF_LOG("info", "  Output:      " << output_path);
    FF_LOG("info", "  FPS:         " << (1000.0 / res.step_time_ms) << " ("
                                     << int(res.step_time_ms) << "ms step)");
    FF_LOG("info", "  Sample rate: " << options.sample_rate << " Hz");
    FF_LOG("info", "  Mode:        " << (res.merged ? "Merged" : "Standalone"));

    // Decode.
    auto decoder = make_decoder_for(input_audio_path, options.ffmpeg_path);
    FF_LOG("debug", "decoder: " << decoder->name());
    SampleBuffer samples;
    res.status = decoder->decode(input_audio_path, samples);
    if (!res.status.ok) {
        return res;
    }
    const auto t_decode = std::chrono::steady_clock::now();
    FF_LOG("info", "Source: " << samples.sample_rate << "Hz, " << samples.channels << "ch, "
                              << samples.frame_count() << " samples ("
                              << (samples.sample_rate
                                      ? double(samples.frame_count()) / samples.sample_rate
                                      : 0.0)
                              << "s)");

    // Transform.
    if (samples.channels > 1 && !(options.stereo && samples.channels == 2)) {
        samples = to_mono(samples);
        FF_LOG("info", "  -> Mono: " << samples.samples.size() << " samples");
    }
    if (samples.sample_rate != options.sample_rate) {
        FF_LOG("info", "Resampling " << samples.sample_rate << "Hz -> " << options.sample_rate
                                     << "Hz...");
        samples = resample_linear(samples, options.sample_rate);
        FF_LOG("info", "  -> " << samples.samples.size() << " samples");
    }
    res.audio_channels = samples.channels;

    // Encode.
    res.status = compute_samples_per_frame(options.sample_rate, res.step_time_ms,
                                           res.samples_per_frame);
    if (!res.status.ok) {
        return res;
    }
    res.channels_per_frame = frame_width(res.samples_per_frame, samples.channels);
    std::vector<Frame> frames;
    res.status = encode_frames(samples, res.samples_per_frame, frames);
    if (!res.status.ok) {
        return res;
    }
    res.frame_count = static_cast<uint32_t>(frames.size());
    if (!frames.empty()) {
        res.first_frame = frames.front();
    }
    FF_LOG("info", "Frame layout:");
    FF_LOG("info", "  Samples/frame:  " << res.samples_per_frame);
    FF_LOG("info", "  Channels/frame: " << res.channels_per_frame << " (2 sync + "
                                        << (res.channels_per_frame - kSyncMarkerSize)
                                        << " PCM)");
    FF_LOG("info", "  Total frames:   " << res.frame_count);
    FF_LOG("info", "  Duration:       "
                       << (double(res.frame_count) * res.step_time_ms / 1000.0) << "s");
    const auto t_encode = std::chrono::steady_clock::now();

    // Write.
    const std::string target = options.atomic_write ? output_path + kTempSuffix : output_path;
    if (res.merged) {
        FF_LOG("info", "Merging into " << options.merge_path << "...");
        MergeResult merge{};
        res.status = merge_into_fseq(frames, res.channels_per_frame, options.merge_path,
                                     options.start_channel, target, merge);
        res.total_channels = merge.total_channels;
        res.total_frames = merge.total_frames;
        res.total_size = merge.total_size;
    } else {
        FF_LOG("info", "Writing FSEQ v2...");
        res.status = write_standalone(target, frames, res.channels_per_frame, res.step_time_ms,
                                      build_variable_header(input_audio_path), res.total_size);
        res.total_channels = res.channels_per_frame;
        res.total_frames = res.frame_count;
    }
    if (options.atomic_write) {
        if (res.status.ok) {
            res.status = commit_output(target, output_path);
        } else {
            discard_output(target);
        }
    }

    const auto t1 = std::chrono::steady_clock::now();
    FF_LOG("debug", "encode_file_to_fseq timings ms: decode=" << elapsed_ms(t0, t_decode)
                                                              << " encode="
                                                              << elapsed_ms(t_decode, t_encode)
                                                              << " write="
                                                              << elapsed_ms(t_encode, t1)
                                                              << " total=" << elapsed_ms(t0, t1));
    return res;
}

ReadResult read_fseq(const std::string &path) {
    ReadResult res;
    res.status = read_header(path, res.header);
    if (!res.status.ok) {
        return res;
    }
    res.status = read_variable_header(path, res.header, res.records);
    return res;
}

Status load_options_json(const std::string &json_path, EncodeOptions &options) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        const int err = errno;
        return make_error(FseqErrc::IoError, "open failed for " + json_path + " errno=" +
                                                 std::to_string(err) + " (" +
                                                 std::generic_category().message(err) + ")");
    }
    const json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error(FseqErrc::InvalidConfig,
                          "options file " + json_path + " is not a JSON object");
    }
    auto resolve_path = [&](const std::string &p) {
        auto base = std::filesystem::path(json_path).parent_path();
        const std::filesystem::path rel(p);
        return (p.empty() || rel.is_absolute() ? rel : base / rel).string();
    };

    EncodeOptions next = options;
    Status st = read_u32_option(j, "fps", next.fps);
    if (st.ok) st = read_u32_option(j, "sample_rate", next.sample_rate);
    if (st.ok) st = read_u32_option(j, "start_channel", next.start_channel);
    if (st.ok && j.contains("step_time_ms")) {
        uint32_t step = 0;
        st = read_u32_option(j, "step_time_ms", step);
        next.step_time_ms = step;
    }
    if (!st.ok) {
        st.message = json_path + ": " + st.message;
        return st;
    }
    if (j.contains("stereo")) {
        if (!j["stereo"].is_boolean()) {
            return make_error(FseqErrc::InvalidConfig,
                              json_path + ": option 'stereo' must be a boolean");
        }
        next.stereo = j["stereo"].get<bool>();
    }
    for (const char *key : {"merge", "ffmpeg"}) {
        if (j.contains(key) && !j[key].is_string()) {
            return make_error(FseqErrc::InvalidConfig,
                              json_path + ": option '" + key + "' must be a string");
        }
    }
    if (j.contains("merge")) {
        next.merge_path = resolve_path(j["merge"].get<std::string>());
    }
    if (j.contains("ffmpeg")) {
        next.ffmpeg_path = j["ffmpeg"].get<std::string>();
    }
    FF_LOG("debug", "options from " << json_path << ": fps=" << next.fps << " step="
                                    << (next.step_time_ms ? std::to_string(*next.step_time_ms)
                                                          : std::string("-"))
                                    << " rate=" << next.sample_rate
                                    << " start_channel=" << next.start_channel
                                    << " stereo=" << next.stereo);
    options = std::move(next);
    return ok_status();
}

}  // namespace fseqforge
