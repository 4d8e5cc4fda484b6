//
//  fseq_header.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "fseq_status.hpp"

namespace fseqforge {

inline constexpr char kFseqMagic[4] = {'P', 'S', 'E', 'Q'};
inline constexpr uint32_t kFixedHeaderSize = 32;
// Bytes carrying the fields through the sparse range count; the reserved byte and the unique
// ID are optional for readers.
inline constexpr uint32_t kMinFixedHeaderBytes = 23;
inline constexpr uint8_t kFseqMajorVersion = 2;
inline constexpr uint8_t kFseqMinorVersion = 0;
inline constexpr uint32_t kChannelDataAlignment = 4;

/// FSEQ v2 fixed header. All multi-byte fields are little endian on disk.
struct FseqHeader {
    uint16_t data_offset = 0;        ///< Byte offset of the channel data
    uint8_t minor_version = kFseqMinorVersion;
    uint8_t major_version = kFseqMajorVersion;
    uint16_t var_header_offset = kFixedHeaderSize;
    uint32_t channel_count = 0;      ///< Channels (bytes) per frame
    uint32_t frame_count = 0;
    uint8_t step_time_ms = 0;
    uint8_t flags = 0;
    uint8_t compression = 0;         ///< 0 = uncompressed
    uint8_t compression_blocks = 0;
    uint8_t sparse_ranges = 0;
    uint8_t reserved = 0;
    uint64_t unique_id = 0;

    bool operator==(const FseqHeader &o) const {
        return data_offset == o.data_offset && minor_version == o.minor_version &&
               major_version == o.major_version && var_header_offset == o.var_header_offset &&
               channel_count == o.channel_count && frame_count == o.frame_count &&
               step_time_ms == o.step_time_ms && flags == o.flags &&
               compression == o.compression && compression_blocks == o.compression_blocks &&
               sparse_ranges == o.sparse_ranges && reserved == o.reserved &&
               unique_id == o.unique_id;
    }
    bool operator!=(const FseqHeader &o) const { return !(*this == o); }
};

/// Tagged variable-header entry: 2-char code, u16 length, value bytes.
struct VariableHeaderRecord {
    std::array<char, 2> code{};
    std::vector<uint8_t> value;

    std::string code_string() const { return std::string(code.data(), code.size()); }
    // Value as text with the trailing NUL (if any) removed.
    std::string text() const;
};

// Media filename record.
inline constexpr char kTagMediaFile[3] = "mf";
// Source/producer record.
inline constexpr char kTagSource[3] = "sp";

// Build a textual record; the value is NUL terminated.
VariableHeaderRecord make_text_record(const char code[3], const std::string &text);

// Pack the fixed header into exactly 32 bytes.
std::vector<uint8_t> encode_fixed_header(const FseqHeader &header);

// Concatenate records in the given order. Throws std::length_error for a value > 65535 bytes.
std::vector<uint8_t> encode_variable_header(const std::vector<VariableHeaderRecord> &records);

// Validate the magic and unpack the fields. Version and compression are not checked.
Status decode_fixed_header(const std::vector<uint8_t> &bytes, FseqHeader &header);

// Parse records until the bytes run out or alignment padding is reached.
Status decode_variable_header(const std::vector<uint8_t> &bytes,
                              std::vector<VariableHeaderRecord> &records);

// 32 + variable header length, rounded up to 4. Throws std::length_error past 0xFFFF.
uint16_t compute_data_offset(size_t variable_header_size);

// Fresh v2.0 uncompressed header for the given grid.
FseqHeader make_header(uint32_t channel_count, uint32_t frame_count, uint8_t step_time_ms,
                       size_t variable_header_size);

// Value of the sp record: "FseqForge <version>".
std::string encoder_id();

// The two records this encoder emits: mf = base name of `media_path`, sp = encoder id.
std::vector<uint8_t> build_variable_header(const std::string &media_path);

}  // namespace fseqforge
