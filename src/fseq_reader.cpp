//
//  fseq_reader.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fseq_reader.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace {

fseqforge::Status open_failed(const std::string &path) {
    const int err = errno;
    return fseqforge::make_error(fseqforge::FseqErrc::IoError,
                                 "open failed for " + path + " errno=" + std::to_string(err) +
                                     " (" + std::generic_category().message(err) + ")");
}

uint64_t file_size(std::ifstream &f) {
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    f.seekg(0, std::ios::beg);
    return len > 0 ? static_cast<uint64_t>(len) : 0;
}

}  // namespace

namespace fseqforge {

Status read_header(const std::string &path, FseqHeader &header) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return open_failed(path);
    }
    std::vector<uint8_t> bytes(kFixedHeaderSize);
    f.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    bytes.resize(static_cast<size_t>(f.gcount()));
    return decode_fixed_header(bytes, header);
}

Status read_channel_data(const std::string &path, const FseqHeader &header,
                         std::vector<uint8_t> &data) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return open_failed(path);
    }
    const uint64_t size = file_size(f);
    const uint64_t expected =
        static_cast<uint64_t>(header.channel_count) * static_cast<uint64_t>(header.frame_count);
    const uint64_t available = size > header.data_offset ? size - header.data_offset : 0;
    if (available < expected) {
        return make_error(FseqErrc::TruncatedChannelData,
                          "channel data truncated in " + path + ": expected " +
                              std::to_string(expected) + " bytes (" +
                              std::to_string(header.channel_count) + " ch x " +
                              std::to_string(header.frame_count) + " frames), found " +
                              std::to_string(available));
    }
    if (available > expected) {
        FF_LOG("io", "ignoring " << (available - expected) << " trailing bytes in " << path);
    }

    data.resize(static_cast<size_t>(expected));
    f.seekg(static_cast<std::streamoff>(header.data_offset), std::ios::beg);
    f.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(expected));
    if (static_cast<uint64_t>(f.gcount()) != expected) {
        return make_error(FseqErrc::TruncatedChannelData,
                          "short read in " + path + ": " + std::to_string(f.gcount()) + " of " +
                              std::to_string(expected) + " bytes");
    }
    return ok_status();
}

Status read_variable_header(const std::string &path, const FseqHeader &header,
                            std::vector<VariableHeaderRecord> &records) {
    records.clear();
    if (header.data_offset <= header.var_header_offset) {
        return ok_status();
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return open_failed(path);
    }
    std::vector<uint8_t> bytes(header.data_offset - header.var_header_offset);
    f.seekg(header.var_header_offset, std::ios::beg);
    f.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    bytes.resize(static_cast<size_t>(f.gcount()));
    return decode_variable_header(bytes, records);
}

}  // namespace fseqforge
