// Fixture builders and byte readers for tests only (kept independent of the
// library code to avoid self-consistency bugs).
#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

inline uint16_t le16(const std::vector<uint8_t> &b, size_t pos) {
    return static_cast<uint16_t>(b[pos] | (b[pos + 1] << 8));
}

inline uint32_t le32(const std::vector<uint8_t> &b, size_t pos) {
    return static_cast<uint32_t>(b[pos]) | (static_cast<uint32_t>(b[pos + 1]) << 8) |
           (static_cast<uint32_t>(b[pos + 2]) << 16) | (static_cast<uint32_t>(b[pos + 3]) << 24);
}

inline void put_le16(std::vector<uint8_t> &b, uint16_t v) {
    b.push_back(v & 0xFF);
    b.push_back((v >> 8) & 0xFF);
}

inline void put_le32(std::vector<uint8_t> &b, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        b.push_back((v >> (8 * i)) & 0xFF);
    }
}

inline void put_tag(std::vector<uint8_t> &b, const char *tag) {
    b.insert(b.end(), tag, tag + 4);
}

// Fresh scratch directory below the system temp directory.
inline std::filesystem::path scratch_dir(const std::string &name) {
    auto dir = std::filesystem::temp_directory_path() / ("fseqforge_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline bool write_file(const std::filesystem::path &path, const std::vector<uint8_t> &bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return false;
    }
    f.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    return f.good();
}

inline std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    f.seekg(0, std::ios::end);
    std::streamoff len = f.tellg();
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(buf.data()), len);
    if (f.gcount() != len) {
        return std::nullopt;
    }
    return buf;
}

/**
 * Integer PCM WAV image. `samples` holds raw little-endian sample values at
 * `bits` width (8-bit values are stored unsigned as given).
 */
inline std::vector<uint8_t> make_wav(uint16_t bits, uint16_t channels, uint32_t rate,
                                     const std::vector<int32_t> &samples,
                                     uint16_t format_tag = 1) {
    const uint32_t bytes_per_sample = bits / 8;
    const uint32_t data_len = static_cast<uint32_t>(samples.size()) * bytes_per_sample;
    std::vector<uint8_t> b;
    put_tag(b, "RIFF");
    put_le32(b, 4 + 8 + 16 + 8 + data_len);
    put_tag(b, "WAVE");
    put_tag(b, "fmt ");
    put_le32(b, 16);
    put_le16(b, format_tag);
    put_le16(b, channels);
    put_le32(b, rate);
    put_le32(b, rate * channels * bytes_per_sample);
    put_le16(b, static_cast<uint16_t>(channels * bytes_per_sample));
    put_le16(b, bits);
    put_tag(b, "data");
    put_le32(b, data_len);
    for (int32_t s : samples) {
        const uint32_t u = static_cast<uint32_t>(s);
        for (uint32_t i = 0; i < bytes_per_sample; ++i) {
            b.push_back((u >> (8 * i)) & 0xFF);
        }
    }
    return b;
}

inline std::vector<uint8_t> make_silent_wav(uint32_t rate, uint16_t channels, uint32_t frames) {
    return make_wav(16, channels, rate, std::vector<int32_t>(size_t(frames) * channels, 0));
}

// Parsed fields of an FSEQ fixed header.
struct RawHeader {
    std::string magic;
    uint16_t data_offset = 0;
    uint8_t minor = 0;
    uint8_t major = 0;
    uint16_t var_offset = 0;
    uint32_t channels = 0;
    uint32_t frames = 0;
    uint8_t step = 0;
    uint8_t compression = 0;
};

inline std::optional<RawHeader> parse_header(const std::vector<uint8_t> &b) {
    if (b.size() < 32) {
        return std::nullopt;
    }
    RawHeader h;
    h.magic.assign(b.begin(), b.begin() + 4);
    h.data_offset = le16(b, 4);
    h.minor = b[6];
    h.major = b[7];
    h.var_offset = le16(b, 8);
    h.channels = le32(b, 10);
    h.frames = le32(b, 14);
    h.step = b[18];
    h.compression = b[20];
    return h;
}

// Text of the first variable header record with `code`, without the trailing NUL.
inline std::optional<std::string> find_record(const std::vector<uint8_t> &b, const char *code) {
    const auto h = parse_header(b);
    if (!h) {
        return std::nullopt;
    }
    size_t pos = h->var_offset;
    while (pos + 4 <= h->data_offset && b[pos] != 0) {
        const size_t len = le16(b, pos + 2);
        if (b[pos] == static_cast<uint8_t>(code[0]) &&
            b[pos + 1] == static_cast<uint8_t>(code[1])) {
            std::string s(b.begin() + pos + 4, b.begin() + pos + 4 + len);
            while (!s.empty() && s.back() == '\0') {
                s.pop_back();
            }
            return s;
        }
        pos += 4 + len;
    }
    return std::nullopt;
}

/**
 * Hand-built FSEQ file: 32-byte header, no variable header, channel byte at
 * (frame f, channel c) = fill(f, c). `drop_tail` removes bytes from the end.
 */
template <typename Fill>
std::vector<uint8_t> make_fseq(uint32_t channels, uint32_t frames, uint8_t step, Fill fill,
                               uint8_t major = 2, uint8_t compression = 0,
                               size_t drop_tail = 0) {
    std::vector<uint8_t> b;
    put_tag(b, "PSEQ");
    put_le16(b, 32);
    b.push_back(0);      // minor
    b.push_back(major);  // major
    put_le16(b, 32);
    put_le32(b, channels);
    put_le32(b, frames);
    b.push_back(step);
    b.push_back(0);            // flags
    b.push_back(compression);  // compression
    b.push_back(0);            // compression blocks
    b.push_back(0);            // sparse ranges
    b.push_back(0);            // reserved
    put_le32(b, 0x12345678);   // unique id
    put_le32(b, 0x9ABCDEF0);
    for (uint32_t f = 0; f < frames; ++f) {
        for (uint32_t c = 0; c < channels; ++c) {
            b.push_back(static_cast<uint8_t>(fill(f, c)));
        }
    }
    b.resize(b.size() - std::min(drop_tail, b.size()));
    return b;
}

}  // namespace test_utils
