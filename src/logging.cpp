//
//  logging.cpp
//  FseqForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace fseqforge {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};
std::atomic<std::ostream *> g_log_stream{nullptr};
std::mutex g_log_mutex;

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error") return LogVerbosity::Error;
    if (tag == "warn" || tag == "warning") return LogVerbosity::Warn;
    if (tag == "info") return LogVerbosity::Info;
    return LogVerbosity::Debug;
}

std::ostream *set_log_stream(std::ostream *stream) {
    return g_log_stream.exchange(stream);
}

bool should_log(const char *tag) {
    const auto sev = severity_for_tag(tag ? tag : "");
    return static_cast<int>(sev) <= g_log_level.load(std::memory_order_relaxed);
}

void log_line(const char *tag, const std::string &msg, const char *file, int line,
              const char *func) {
    std::ostream *custom = g_log_stream.load();
    std::ostream &out = custom ? *custom : std::cerr;
    const std::string_view t(tag ? tag : "");

    std::lock_guard<std::mutex> lock(g_log_mutex);
    out << "[FseqForge][" << t << "]";
    // Errors carry their origin.
    if (t == "error") {
        out << "[" << file << ":" << line << " " << func << "]";
    }
    out << " " << msg << std::endl;
}

std::string hex_prefix(const std::vector<uint8_t> &data, size_t max_len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return oss.str();
}

}  // namespace fseqforge
