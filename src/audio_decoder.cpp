//
//  audio_decoder.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

#include "byte_io.hpp"
#include "logging.hpp"

namespace {

using fseqforge::FseqErrc;
using fseqforge::make_error;
using fseqforge::Status;

constexpr size_t kRiffHeaderSize = 12;
constexpr size_t kChunkHeaderSize = 8;
constexpr size_t kFmtMinSize = 16;
constexpr size_t kFmtExtensibleSize = 40;
constexpr size_t kFmtSubformatOffset = 24;
constexpr uint16_t kWaveFormatPcm = 0x0001;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;
constexpr uint32_t kStreamedChunkSize = 0xFFFFFFFF;  // size unknown when written to a pipe
constexpr size_t kPipeReadChunk = 64 * 1024;

struct WavFormat {
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
};

Status read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        const int err = errno;
        return make_error(FseqErrc::IoError, "open failed for " + path + " errno=" +
                                                 std::to_string(err) + " (" +
                                                 std::generic_category().message(err) + ")");
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    f.seekg(0, std::ios::beg);
    out.resize(len > 0 ? static_cast<size_t>(len) : 0);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(out.size()));
    if (static_cast<size_t>(f.gcount()) != out.size()) {
        return make_error(FseqErrc::IoError, "short read for " + path);
    }
    return fseqforge::ok_status();
}

int16_t convert_sample(const uint8_t *p, uint16_t bits) {
    switch (bits) {
        case 8:
            // Unsigned 8-bit, centered at 128.
            return static_cast<int16_t>((static_cast<int32_t>(p[0]) - 128) * 256);
        case 16:
            return static_cast<int16_t>(read_le16(p));
        case 24:
            // Keep the top 16 bits of the signed 24-bit value.
            return static_cast<int16_t>(uint16_t(p[1]) | (uint16_t(p[2]) << 8));
        case 32:
            return static_cast<int16_t>(static_cast<int32_t>(read_le32(p)) >> 16);
        default:
            return 0;
    }
}

std::string shell_quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool is_executable(const std::filesystem::path &p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

namespace fseqforge {

// -----------------------------------------------------------------------------
// RIFF/WAVE parsing.
// -----------------------------------------------------------------------------
Status decode_wav_bytes(const std::vector<uint8_t> &bytes, SampleBuffer &out) {
    if (bytes.size() < kRiffHeaderSize || read_le32(bytes.data()) != riff_id('R', 'I', 'F', 'F') ||
        read_le32(bytes.data() + 8) != riff_id('W', 'A', 'V', 'E')) {
        return make_error(FseqErrc::InvalidAudio, "Not a RIFF/WAVE file");
    }

    WavFormat fmt;
    bool have_fmt = false;
    bool have_data = false;
    uint64_t data_start = 0;
    uint64_t data_len = 0;

    uint64_t pos = kRiffHeaderSize;
    while (pos + kChunkHeaderSize <= bytes.size() && (!have_fmt || !have_data)) {
        const uint32_t id = read_le32(bytes.data() + pos);
        const uint32_t size = read_le32(bytes.data() + pos + 4);
        const uint64_t body = pos + kChunkHeaderSize;
        const uint64_t available = bytes.size() - body;

        if (id == riff_id('f', 'm', 't', ' ')) {
            if (size < kFmtMinSize || available < kFmtMinSize) {
                return make_error(FseqErrc::InvalidAudio,
                                  "fmt chunk too small (" + std::to_string(size) + " bytes)");
            }
            const uint8_t *p = bytes.data() + body;
            fmt.format_tag = read_le16(p);
            fmt.channels = read_le16(p + 2);
            fmt.sample_rate = read_le32(p + 4);
            fmt.bits_per_sample = read_le16(p + 14);
            if (fmt.format_tag == kWaveFormatExtensible && size >= kFmtExtensibleSize &&
                available >= kFmtExtensibleSize) {
                // First two bytes of the subformat GUID carry the actual format tag.
                fmt.format_tag = read_le16(p + kFmtSubformatOffset);
            }
            have_fmt = true;
        } else if (id == riff_id('d', 'a', 't', 'a')) {
            data_start = body;
            data_len = (size == kStreamedChunkSize) ? available
                                                    : std::min<uint64_t>(size, available);
            if (size != kStreamedChunkSize && size > available) {
                FF_LOG("warn", "WAV data chunk claims " << size << " bytes, only " << available
                                                        << " present");
            }
            have_data = true;
        }

        if (size > available) {
            break;
        }
        // Chunks are word-aligned.
        pos = body + size + (size & 1);
    }

    if (!have_fmt || !have_data) {
        return make_error(FseqErrc::InvalidAudio, "Missing fmt/data chunk");
    }
    if (fmt.format_tag != kWaveFormatPcm) {
        std::ostringstream oss;
        oss << "unsupported WAV format tag 0x" << std::hex << fmt.format_tag
            << " (integer PCM only)";
        return make_error(FseqErrc::InvalidAudio, oss.str());
    }
    if (fmt.bits_per_sample != 8 && fmt.bits_per_sample != 16 && fmt.bits_per_sample != 24 &&
        fmt.bits_per_sample != 32) {
        return make_error(FseqErrc::UnsupportedSampleWidth,
                          "Unsupported sample width: " + std::to_string(fmt.bits_per_sample) +
                              " bits");
    }
    if (fmt.channels == 0 || fmt.sample_rate == 0) {
        return make_error(FseqErrc::InvalidAudio,
                          "invalid WAV format: channels=" + std::to_string(fmt.channels) +
                              " rate=" + std::to_string(fmt.sample_rate));
    }

    const size_t bytes_per_sample = fmt.bits_per_sample / 8;
    size_t count = static_cast<size_t>(data_len / bytes_per_sample);
    count -= count % fmt.channels;

    SampleBuffer buf;
    buf.sample_rate = fmt.sample_rate;
    buf.channels = fmt.channels;
    buf.samples.resize(count);
    const uint8_t *p = bytes.data() + data_start;
    for (size_t i = 0; i < count; ++i) {
        buf.samples[i] = convert_sample(p + i * bytes_per_sample, fmt.bits_per_sample);
    }
    FF_LOG("debug", "decode_wav_bytes: " << fmt.sample_rate << "Hz " << fmt.channels << "ch "
                                         << fmt.bits_per_sample << "-bit, " << buf.frame_count()
                                         << " frames");
    out = std::move(buf);
    return ok_status();
}

Status WavDecoder::decode(const std::string &path, SampleBuffer &out) {
    std::vector<uint8_t> bytes;
    Status st = read_file(path, bytes);
    if (!st.ok) {
        return st;
    }
    st = decode_wav_bytes(bytes, out);
    if (!st.ok) {
        st.message = path + ": " + st.message;
    }
    return st;
}

// -----------------------------------------------------------------------------
// Delegated decode through ffmpeg.
// -----------------------------------------------------------------------------
std::string FfmpegDecoder::locate() const {
    if (!ffmpeg_path_.empty()) {
        return is_executable(ffmpeg_path_) ? ffmpeg_path_ : std::string();
    }
    const char *env = std::getenv("PATH");
    if (!env) {
        return {};
    }
    std::stringstream dirs(env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / "ffmpeg";
        if (is_executable(candidate)) {
            return candidate.string();
        }
    }
    return {};
}

Status FfmpegDecoder::decode(const std::string &path, SampleBuffer &out) {
    const std::string exe = locate();
    if (exe.empty()) {
        const auto ext = std::filesystem::path(path).extension().string();
        return make_error(FseqErrc::MissingDecoderDependency,
                          "ffmpeg is required for non-WAV input (" +
                              (ext.empty() ? std::string("no extension") : ext) +
                              "); install ffmpeg or pass --ffmpeg PATH" +
                              (ffmpeg_path_.empty() ? "" : " (not executable: " + ffmpeg_path_ +
                                                               ")"));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error(FseqErrc::IoError, "input not found: " + path);
    }

    const std::string cmd = shell_quote(exe) + " -nostdin -v error -i " + shell_quote(path) +
                            " -f wav -acodec pcm_s16le -";
    FF_LOG("debug", "running: " << cmd);
    FILE *pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        const int err = errno;
        return make_error(FseqErrc::IoError,
                          "failed to start ffmpeg (" + std::generic_category().message(err) + ")");
    }
    std::vector<uint8_t> bytes;
    std::vector<uint8_t> chunk(kPipeReadChunk);
    size_t n = 0;
    while ((n = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
    }
    const int rc = ::pclose(pipe);
    if (rc != 0) {
        const int code = (rc != -1 && WIFEXITED(rc)) ? WEXITSTATUS(rc) : rc;
        return make_error(FseqErrc::InvalidAudio,
                          "ffmpeg failed to decode " + path + " (exit status " +
                              std::to_string(code) + ")");
    }
    FF_LOG("debug", "ffmpeg produced " << bytes.size() << " bytes of WAV");
    Status st = decode_wav_bytes(bytes, out);
    if (!st.ok) {
        st.message = path + " (via ffmpeg): " + st.message;
    }
    return st;
}

AudioDecoderPtr make_decoder_for(const std::string &path, const std::string &ffmpeg_path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".wav" || ext == ".wave") {
        return std::make_unique<WavDecoder>();
    }
    return std::make_unique<FfmpegDecoder>(ffmpeg_path);
}

}  // namespace fseqforge
