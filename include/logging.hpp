//
//  logging.hpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fseqforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a command-line level name (error|warn|warning|info|debug) to a verbosity. Unknown names
// map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Severity of a log tag. "error", "warn"/"warning" and "info" map to their level; subsystem
// tags ("io", "codec", "merge", "decode", ...) are debug output.
LogVerbosity severity_for_tag(std::string_view tag);

// Destination for log lines; nullptr restores std::cerr. Returns the previous stream.
std::ostream *set_log_stream(std::ostream *stream);

bool should_log(const char *tag);
void log_line(const char *tag, const std::string &msg, const char *file, int line,
              const char *func);

// Space separated hex of the first `max_len` bytes, for dumping frame and header prefixes.
inline constexpr size_t kHexPreviewBytes = 8;
std::string hex_prefix(const std::vector<uint8_t> &data, size_t max_len = kHexPreviewBytes);

}  // namespace fseqforge

#define FF_LOG(tag, message)                                                          \
    do {                                                                              \
        if (fseqforge::should_log(tag)) {                                             \
            std::ostringstream _ff_log_ss;                                            \
            _ff_log_ss << message;                                                    \
            fseqforge::log_line(tag, _ff_log_ss.str(), __FILE__, __LINE__, __func__); \
        }                                                                             \
    } while (0)
