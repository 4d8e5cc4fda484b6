//
//  fseq_writer.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "frame_encoder.hpp"
#include "fseq_header.hpp"
#include "fseq_status.hpp"

namespace fseqforge {

// Write fixed header, variable header and zero padding up to header.data_offset.
// Returns the number of bytes written (== header.data_offset).
uint64_t write_preamble(std::ofstream &out, const FseqHeader &header,
                        const std::vector<uint8_t> &variable_header);

/**
 * @brief Write a standalone uncompressed FSEQ v2 file.
 *
 * Frames are written back to back after the aligned header block. Each frame is checked against
 * `channels_per_frame` while writing; on FrameSizeMismatch the file is left partially written.
 *
 * @param total_size Receives data offset + frames * channels_per_frame.
 */
Status write_standalone(const std::string &path, const std::vector<Frame> &frames,
                        uint32_t channels_per_frame, uint8_t step_time_ms,
                        const std::vector<uint8_t> &variable_header, uint64_t &total_size);

}  // namespace fseqforge
