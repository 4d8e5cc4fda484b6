//
//  fseq_writer.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "fseq_writer.hpp"

#include <cerrno>
#include <system_error>

#include "logging.hpp"

namespace fseqforge {

// -----------------------------------------------------------------------------
// Header block: fixed header, variable header, alignment padding.
// -----------------------------------------------------------------------------
uint64_t write_preamble(std::ofstream &out, const FseqHeader &header,
                        const std::vector<uint8_t> &variable_header) {
    const auto fixed = encode_fixed_header(header);
    out.write(reinterpret_cast<const char *>(fixed.data()),
              static_cast<std::streamsize>(fixed.size()));
    if (!variable_header.empty()) {
        out.write(reinterpret_cast<const char *>(variable_header.data()),
                  static_cast<std::streamsize>(variable_header.size()));
    }
    const uint64_t written = fixed.size() + variable_header.size();
    if (header.data_offset > written) {
        const std::vector<char> padding(header.data_offset - written, 0);
        out.write(padding.data(), static_cast<std::streamsize>(padding.size()));
    }
    return header.data_offset;
}

// -----------------------------------------------------------------------------
// Standalone file.
// -----------------------------------------------------------------------------
Status write_standalone(const std::string &path, const std::vector<Frame> &frames,
                        uint32_t channels_per_frame, uint8_t step_time_ms,
                        const std::vector<uint8_t> &variable_header, uint64_t &total_size) {
    const FseqHeader header = make_header(channels_per_frame,
                                          static_cast<uint32_t>(frames.size()), step_time_ms,
                                          variable_header.size());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        const int err = errno;
        return make_error(FseqErrc::IoError, "open failed for " + path + " (" +
                                                 std::generic_category().message(err) + ")");
    }

    write_preamble(out, header, variable_header);
    FF_LOG("io", "write_standalone: header block " << header.data_offset << " bytes, "
                                                   << frames.size() << " frames x "
                                                   << channels_per_frame << " channels");

    for (size_t i = 0; i < frames.size(); ++i) {
        const auto &frame = frames[i];
        if (frame.size() != channels_per_frame) {
            return make_error(FseqErrc::FrameSizeMismatch,
                              "Frame size mismatch at frame " + std::to_string(i) + ": " +
                                  std::to_string(frame.size()) +
                                  " != " + std::to_string(channels_per_frame));
        }
        out.write(reinterpret_cast<const char *>(frame.data()),
                  static_cast<std::streamsize>(frame.size()));
    }
    out.flush();
    if (!out.good()) {
        return make_error(FseqErrc::IoError, "write failed for " + path);
    }

    total_size = static_cast<uint64_t>(header.data_offset) +
                 static_cast<uint64_t>(frames.size()) * channels_per_frame;
    return ok_status();
}

}  // namespace fseqforge
