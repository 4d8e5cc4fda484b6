//
//  byte_io.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <vector>

// ------------- Little-endian write helpers (FSEQ, RIFF) ----------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_le16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_le32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_le64(std::vector<uint8_t> &p, uint64_t v) {
    write_le32(p, static_cast<uint32_t>(v & 0xFFFFFFFF));
    write_le32(p, static_cast<uint32_t>(v >> 32));
}

// Big-endian 16-bit, used for the PCM sample bytes inside a frame.
inline void write_be16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

// ------------- Little-endian read helpers (caller checks bounds) ------------

inline uint16_t read_le16(const uint8_t *p) {
    return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
}

inline uint32_t read_le32(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

inline uint64_t read_le64(const uint8_t *p) {
    return uint64_t(read_le32(p)) | (uint64_t(read_le32(p + 4)) << 32);
}

// Two-character tag code (FSEQ variable header record), first char in the low byte.
inline constexpr uint16_t tag_code(const char a, const char b) {
    return static_cast<uint16_t>(uint16_t(uint8_t(a)) | (uint16_t(uint8_t(b)) << 8));
}

// RIFF chunk id, first char in the low byte (as stored in the file).
inline constexpr uint32_t riff_id(const char a, const char b, const char c, const char d) {
    return uint32_t(uint8_t(a)) | (uint32_t(uint8_t(b)) << 8) | (uint32_t(uint8_t(c)) << 16) |
           (uint32_t(uint8_t(d)) << 24);
}
