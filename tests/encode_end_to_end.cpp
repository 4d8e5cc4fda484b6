// End-to-end coverage: WAV in, FSEQ out (standalone and merged), options files and failures.
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "fseqforge.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

using fseqforge::EncodeOptions;
using fseqforge::FseqErrc;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[encode_end_to_end] FAIL: " << msg << "\n";
    }
    return cond;
}

void write_text(const std::filesystem::path &path, const std::string &text) {
    std::ofstream f(path);
    f << text;
}

bool test_silent_second(const std::filesystem::path &dir) {
    const auto wav = dir / "silence.wav";
    const auto out = dir / "silence.fseq";
    test_utils::write_file(wav, test_utils::make_silent_wav(44100, 1, 44100));

    auto res = fseqforge::encode_file_to_fseq(wav.string(), out.string());
    bool ok = check(res.status.ok, "encode silent second: " + res.status.message);
    ok &= check(!res.merged && res.step_time_ms == 25, "standalone at 25 ms");
    ok &= check(res.samples_per_frame == 1102 && res.channels_per_frame == 2206,
                "1102 samples -> 2206 channels per frame");
    // 44100 / 1102 leaves 40 samples for a padded 41st frame.
    ok &= check(res.frame_count == 41 && res.total_frames == 41, "41 frames");
    ok &= check(!std::filesystem::exists(dir / "silence.fseq.tmp"), "temporary renamed away");

    auto bytes = test_utils::read_file(out);
    if (!check(bytes.has_value(), "output readable")) {
        return false;
    }
    auto h = test_utils::parse_header(*bytes);
    if (!check(h.has_value() && h->channels == 2206 && h->frames == 41 && h->step == 25,
               "header grid")) {
        return false;
    }
    ok &= check(bytes->size() == res.total_size, "reported size");
    ok &= check(bytes->size() == h->data_offset + 41u * 2206u, "file size");
    ok &= check(test_utils::find_record(*bytes, "mf") == std::string("silence.wav"), "mf record");
    ok &= check(test_utils::find_record(*bytes, "sp").value_or("").rfind("FseqForge", 0) == 0,
                "sp record");
    bool frames_ok = true;
    for (uint32_t f = 0; f < 41; ++f) {
        const size_t base = h->data_offset + f * 2206u;
        frames_ok &= (*bytes)[base] == 0xAA && (*bytes)[base + 1] == 0x55;
        for (size_t i = 2; i < 2206; ++i) {
            frames_ok &= (*bytes)[base + i] == 0;
        }
    }
    ok &= check(frames_ok, "every frame is 0xAA 0x55 then silence");
    ok &= check(res.first_frame.size() == 2206 && res.first_frame[0] == 0xAA,
                "first frame returned for the verbose dump");

    auto read = fseqforge::read_fseq(out.string());
    ok &= check(read.status.ok && read.header.frame_count == 41 && read.records.size() == 2,
                "read back header and records");
    return ok;
}

bool test_transform_paths(const std::filesystem::path &dir) {
    const auto wav = dir / "stereo48k.wav";
    // 0.5 s of 48 kHz stereo.
    std::vector<int32_t> samples;
    for (int i = 0; i < 24000; ++i) {
        samples.push_back(1000);
        samples.push_back(-500);
    }
    test_utils::write_file(wav, test_utils::make_wav(16, 2, 48000, samples));

    auto res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "mono.fseq").string());
    bool ok = check(res.status.ok && res.audio_channels == 1, "mixed to mono by default");
    // 24000 frames at 48 kHz -> 22050 at 44.1 kHz -> ceil(22050 / 1102) frames.
    ok &= check(res.frame_count == 21 && res.channels_per_frame == 2206, "resampled mono grid");
    ok &= check(res.first_frame.size() > 3 && res.first_frame[2] == 0x00 &&
                    res.first_frame[3] == 0xFA,
                "mono mean (1000 - 500) / 2 = 250");

    EncodeOptions stereo;
    stereo.stereo = true;
    stereo.step_time_ms = 50;
    res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "stereo.fseq").string(), stereo);
    ok &= check(res.status.ok && res.audio_channels == 2, "stereo kept");
    ok &= check(res.step_time_ms == 50 && res.samples_per_frame == 2205 &&
                    res.channels_per_frame == 2 + 2205 * 4,
                "step time overrides fps");
    ok &= check(res.first_frame.size() > 5 && res.first_frame[2] == 0x03 &&
                    res.first_frame[3] == 0xE8 && res.first_frame[4] == 0xFE &&
                    res.first_frame[5] == 0x0C,
                "left then right sample");
    return ok;
}

bool test_merge(const std::filesystem::path &dir) {
    const auto light = dir / "show.fseq";
    const auto wav = dir / "tenth.wav";
    const auto out = dir / "show_audio.fseq";
    test_utils::write_file(light, test_utils::make_fseq(4, 10, 50, [](uint32_t f, uint32_t c) {
                               return 0x10 + f * 4 + c;
                           }));
    test_utils::write_file(wav, test_utils::make_silent_wav(44100, 1, 4410));

    EncodeOptions options;
    options.merge_path = light.string();
    options.start_channel = 4;
    auto res = fseqforge::encode_file_to_fseq(wav.string(), out.string(), options);
    bool ok = check(res.status.ok, "merge: " + res.status.message);
    ok &= check(res.merged && res.frame_count == 5, "five audio frames");
    ok &= check(res.total_channels == 2210 && res.total_frames == 10, "union grid");

    auto bytes = test_utils::read_file(out);
    auto h = bytes ? test_utils::parse_header(*bytes) : std::nullopt;
    if (!check(h.has_value(), "merged output readable")) {
        return false;
    }
    ok &= check(h->channels == 2210 && h->frames == 10 && h->step == 50, "merged header");
    ok &= check(bytes->size() == res.total_size, "reported merged size");
    const size_t row5 = h->data_offset + 5u * 2210u;
    ok &= check((*bytes)[row5] == 0x10 + 20 && (*bytes)[row5 + 4] == 0 &&
                    (*bytes)[row5 + 5] == 0,
                "light continues after the audio ends");
    const size_t row0 = h->data_offset;
    ok &= check((*bytes)[row0 + 4] == 0xAA && (*bytes)[row0 + 5] == 0x55, "audio at channel 4");
    return ok;
}

bool test_failures(const std::filesystem::path &dir) {
    const auto wav = dir / "short.wav";
    test_utils::write_file(wav, test_utils::make_silent_wav(44100, 1, 100));
    bool ok = true;

    EncodeOptions bad_fps;
    bad_fps.fps = 0;
    auto res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "a.fseq").string(), bad_fps);
    ok &= check(res.status.code == FseqErrc::InvalidFrameRate, "fps 0 rejected");
    bad_fps.fps = 3;  // 333 ms does not fit the step time byte
    res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "a.fseq").string(), bad_fps);
    ok &= check(res.status.code == FseqErrc::InvalidFrameRate, "step over 255 ms rejected");
    bad_fps.fps = 2000;
    res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "a.fseq").string(), bad_fps);
    ok &= check(res.status.code == FseqErrc::InvalidFrameRate, "step of 0 ms rejected");
    ok &= check(!std::filesystem::exists(dir / "a.fseq"), "nothing written for bad rates");

    EncodeOptions low_rate;
    low_rate.sample_rate = 10;
    res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "b.fseq").string(), low_rate);
    ok &= check(res.status.code == FseqErrc::InvalidFrameRate, "zero samples per frame");

    const auto compressed = dir / "zstd.fseq";
    test_utils::write_file(compressed,
                           test_utils::make_fseq(4, 2, 25, [](uint32_t, uint32_t) { return 0; },
                                                 2, 1));
    EncodeOptions merge;
    merge.merge_path = compressed.string();
    const auto out = dir / "c.fseq";
    res = fseqforge::encode_file_to_fseq(wav.string(), out.string(), merge);
    ok &= check(res.status.code == FseqErrc::UnsupportedCompression, "compressed target");
    ok &= check(!std::filesystem::exists(out) && !std::filesystem::exists(dir / "c.fseq.tmp"),
                "no output or temporary left behind");

    const auto mp3 = dir / "song.mp3";
    test_utils::write_file(mp3, {'I', 'D', '3', 4, 0});
    EncodeOptions no_ffmpeg;
    no_ffmpeg.ffmpeg_path = (dir / "missing-ffmpeg").string();
    res = fseqforge::encode_file_to_fseq(mp3.string(), (dir / "d.fseq").string(), no_ffmpeg);
    ok &= check(res.status.code == FseqErrc::MissingDecoderDependency, "ffmpeg missing");

    const auto wav12 = dir / "twelve.wav";
    test_utils::write_file(wav12, test_utils::make_wav(12, 1, 8000, {1, 2}));
    res = fseqforge::encode_file_to_fseq(wav12.string(), (dir / "e.fseq").string());
    ok &= check(res.status.code == FseqErrc::UnsupportedSampleWidth, "12-bit WAV rejected");

    EncodeOptions in_place;
    in_place.atomic_write = false;
    res = fseqforge::encode_file_to_fseq(wav.string(), (dir / "f.fseq").string(), in_place);
    ok &= check(res.status.ok && res.frame_count == 1, "non-atomic write");
    return ok;
}

bool test_step_time() {
    EncodeOptions o;
    uint8_t step = 0;
    bool ok = check(fseqforge::resolve_step_time(o, step).ok && step == 25, "40 fps -> 25 ms");
    o.fps = 30;
    ok &= check(fseqforge::resolve_step_time(o, step).ok && step == 33, "30 fps -> 33 ms");
    o.step_time_ms = 255;
    ok &= check(fseqforge::resolve_step_time(o, step).ok && step == 255, "explicit 255 ms");
    o.step_time_ms = 0;
    ok &= check(!fseqforge::resolve_step_time(o, step).ok, "explicit 0 ms rejected");
    return ok;
}

bool test_options_json(const std::filesystem::path &dir) {
    const auto path = dir / "options.json";
    write_text(path, R"({"fps": 20, "sample_rate": 22050, "merge": "show.fseq",
        "start_channel": 10, "stereo": true, "ffmpeg": "/opt/bin/ffmpeg", "comment": "x"})");
    EncodeOptions o;
    auto st = fseqforge::load_options_json(path.string(), o);
    bool ok = check(st.ok, "load options: " + st.message);
    ok &= check(o.fps == 20 && o.sample_rate == 22050 && o.start_channel == 10 && o.stereo,
                "numeric and boolean options");
    ok &= check(o.merge_path == (dir / "show.fseq").string(),
                "relative merge path resolved against the options file");
    ok &= check(o.ffmpeg_path == "/opt/bin/ffmpeg", "ffmpeg path as given");
    ok &= check(!o.step_time_ms.has_value() && o.atomic_write, "untouched options keep defaults");

    write_text(path, R"({"step_time_ms": 50})");
    st = fseqforge::load_options_json(path.string(), o);
    ok &= check(st.ok && o.step_time_ms == 50u && o.fps == 20, "options layer on top");

    const char *bad[] = {R"({"fps": "fast"})", R"({"fps": -1})", R"({"stereo": 1})",
                         R"({"merge": 5})", "[1, 2]", "{not json"};
    for (const char *text : bad) {
        write_text(path, text);
        EncodeOptions before;
        EncodeOptions after;
        st = fseqforge::load_options_json(path.string(), after);
        ok &= check(!st.ok && st.code == FseqErrc::InvalidConfig,
                    std::string("rejected options: ") + text);
        ok &= check(after.fps == before.fps && after.merge_path.empty() && !after.stereo,
                    std::string("options unchanged after: ") + text);
    }

    EncodeOptions o2;
    st = fseqforge::load_options_json((dir / "absent.json").string(), o2);
    ok &= check(!st.ok && st.code == FseqErrc::IoError, "missing options file");
    return ok;
}

}  // namespace

int main() {
    fseqforge::set_log_verbosity(fseqforge::LogVerbosity::Warn);
    const auto dir = test_utils::scratch_dir("encode_end_to_end");
    bool ok = true;
    ok &= test_silent_second(dir);
    ok &= test_transform_paths(dir);
    ok &= test_merge(dir);
    ok &= test_failures(dir);
    ok &= test_step_time();
    ok &= test_options_json(dir);
    std::filesystem::remove_all(dir);
    return ok ? 0 : 1;
}
