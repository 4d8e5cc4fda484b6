//
//  fseq_header.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fseq_header.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "byte_io.hpp"
#include "fseqforge_version.hpp"
#include "logging.hpp"

namespace {

constexpr size_t kRecordHeaderSize = 4;  // code (2) + length (2)
constexpr size_t kMaxRecordValue = 0xFFFF;

std::string describe_magic(const std::vector<uint8_t> &bytes) {
    std::ostringstream oss;
    const size_t n = std::min<size_t>(4, bytes.size());
    oss << "'";
    for (size_t i = 0; i < n; ++i) {
        const char c = static_cast<char>(bytes[i]);
        oss << ((c >= 0x20 && c <= 0x7E) ? c : '.');
    }
    oss << "' (" << fseqforge::hex_prefix(bytes, 4) << ")";
    return oss.str();
}

}  // namespace

namespace fseqforge {

std::string VariableHeaderRecord::text() const {
    std::string s(value.begin(), value.end());
    while (!s.empty() && s.back() == '\0') {
        s.pop_back();
    }
    return s;
}

VariableHeaderRecord make_text_record(const char code[3], const std::string &text) {
    VariableHeaderRecord r;
    r.code = {code[0], code[1]};
    r.value.assign(text.begin(), text.end());
    r.value.push_back(0);
    return r;
}

// -----------------------------------------------------------------------------
// Fixed header (32 bytes).
// -----------------------------------------------------------------------------
std::vector<uint8_t> encode_fixed_header(const FseqHeader &h) {
    std::vector<uint8_t> out;
    out.reserve(kFixedHeaderSize);
    for (char c : kFseqMagic) {
        write_u8(out, static_cast<uint8_t>(c));  // 0-3
    }
    write_le16(out, h.data_offset);         // 4-5
    write_u8(out, h.minor_version);         // 6
    write_u8(out, h.major_version);         // 7
    write_le16(out, h.var_header_offset);   // 8-9
    write_le32(out, h.channel_count);       // 10-13
    write_le32(out, h.frame_count);         // 14-17
    write_u8(out, h.step_time_ms);          // 18
    write_u8(out, h.flags);                 // 19
    write_u8(out, h.compression);           // 20
    write_u8(out, h.compression_blocks);    // 21
    write_u8(out, h.sparse_ranges);         // 22
    write_u8(out, h.reserved);              // 23
    write_le64(out, h.unique_id);           // 24-31

    if (out.size() != kFixedHeaderSize) {
        throw std::logic_error("fixed header size mismatch: " + std::to_string(out.size()));
    }
    return out;
}

Status decode_fixed_header(const std::vector<uint8_t> &bytes, FseqHeader &h) {
    if (bytes.size() < 4 || bytes[0] != kFseqMagic[0] || bytes[1] != kFseqMagic[1] ||
        bytes[2] != kFseqMagic[2] || bytes[3] != kFseqMagic[3]) {
        return make_error(FseqErrc::NotAnFseqFile,
                          "Not an FSEQ file (magic: " + describe_magic(bytes) + ")");
    }
    if (bytes.size() < kMinFixedHeaderBytes) {
        return make_error(FseqErrc::NotAnFseqFile,
                          "FSEQ header truncated: " + std::to_string(bytes.size()) +
                              " bytes, need at least " + std::to_string(kMinFixedHeaderBytes));
    }
    const uint8_t *p = bytes.data();
    FseqHeader out;
    out.data_offset = read_le16(p + 4);
    out.minor_version = p[6];
    out.major_version = p[7];
    out.var_header_offset = read_le16(p + 8);
    out.channel_count = read_le32(p + 10);
    out.frame_count = read_le32(p + 14);
    out.step_time_ms = p[18];
    out.flags = p[19];
    out.compression = p[20];
    out.compression_blocks = p[21];
    out.sparse_ranges = p[22];
    if (bytes.size() >= 24) {
        out.reserved = p[23];
    }
    if (bytes.size() >= kFixedHeaderSize) {
        out.unique_id = read_le64(p + 24);
    }
    h = out;
    FF_LOG("codec", "decoded header: v" << int(h.major_version) << "." << int(h.minor_version)
                                        << " channels=" << h.channel_count
                                        << " frames=" << h.frame_count
                                        << " step=" << int(h.step_time_ms)
                                        << "ms data_offset=" << h.data_offset
                                        << " compression=" << int(h.compression));
    return ok_status();
}

// -----------------------------------------------------------------------------
// Variable header records.
// -----------------------------------------------------------------------------
std::vector<uint8_t> encode_variable_header(const std::vector<VariableHeaderRecord> &records) {
    std::vector<uint8_t> out;
    for (const auto &r : records) {
        if (r.value.size() > kMaxRecordValue) {
            throw std::length_error("variable header record '" + r.code_string() + "' is " +
                                    std::to_string(r.value.size()) + " bytes");
        }
        write_u8(out, static_cast<uint8_t>(r.code[0]));
        write_u8(out, static_cast<uint8_t>(r.code[1]));
        write_le16(out, static_cast<uint16_t>(r.value.size()));
        out.insert(out.end(), r.value.begin(), r.value.end());
    }
    return out;
}

Status decode_variable_header(const std::vector<uint8_t> &bytes,
                              std::vector<VariableHeaderRecord> &records) {
    records.clear();
    size_t pos = 0;
    while (pos + kRecordHeaderSize <= bytes.size()) {
        // Zero code: we ran into the alignment padding.
        if (bytes[pos] == 0) {
            break;
        }
        VariableHeaderRecord r;
        r.code = {static_cast<char>(bytes[pos]), static_cast<char>(bytes[pos + 1])};
        const size_t len = read_le16(bytes.data() + pos + 2);
        const size_t value_start = pos + kRecordHeaderSize;
        if (value_start + len > bytes.size()) {
            return make_error(FseqErrc::NotAnFseqFile,
                              "variable header record '" + r.code_string() + "' claims " +
                                  std::to_string(len) + " bytes, only " +
                                  std::to_string(bytes.size() - value_start) + " available");
        }
        r.value.assign(bytes.begin() + value_start, bytes.begin() + value_start + len);
        records.emplace_back(std::move(r));
        pos = value_start + len;
    }
    return ok_status();
}

// -----------------------------------------------------------------------------
// Layout helpers.
// -----------------------------------------------------------------------------
uint16_t compute_data_offset(size_t variable_header_size) {
    size_t offset = kFixedHeaderSize + variable_header_size;
    offset += (kChannelDataAlignment - (offset % kChannelDataAlignment)) % kChannelDataAlignment;
    if (offset > 0xFFFF) {
        throw std::length_error("channel data offset " + std::to_string(offset) +
                                " does not fit the 16-bit header field");
    }
    return static_cast<uint16_t>(offset);
}

FseqHeader make_header(uint32_t channel_count, uint32_t frame_count, uint8_t step_time_ms,
                       size_t variable_header_size) {
    FseqHeader h;
    h.data_offset = compute_data_offset(variable_header_size);
    h.var_header_offset = kFixedHeaderSize;
    h.channel_count = channel_count;
    h.frame_count = frame_count;
    h.step_time_ms = step_time_ms;
    return h;
}

std::string encoder_id() { return std::string("FseqForge ") + FSEQFORGE_VERSION_DISPLAY; }

std::vector<uint8_t> build_variable_header(const std::string &media_path) {
    const std::string name = std::filesystem::path(media_path).filename().string();
    std::vector<VariableHeaderRecord> records;
    records.push_back(make_text_record(kTagMediaFile, name));
    records.push_back(make_text_record(kTagSource, encoder_id()));
    return encode_variable_header(records);
}

}  // namespace fseqforge
