//
//  fseq_reader.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "fseq_header.hpp"
#include "fseq_status.hpp"

namespace fseqforge {

// Read and decode the fixed header. Compression and version are left to the caller.
Status read_header(const std::string &path, FseqHeader &header);

// Read the channel_count * frame_count bytes at header.data_offset.
// A short file yields TruncatedChannelData.
Status read_channel_data(const std::string &path, const FseqHeader &header,
                         std::vector<uint8_t> &data);

// Records stored between the variable header offset and the data offset.
Status read_variable_header(const std::string &path, const FseqHeader &header,
                            std::vector<VariableHeaderRecord> &records);

}  // namespace fseqforge
