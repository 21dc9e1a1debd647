//
//  logging.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/logging.hpp"

#include "tempoit/config.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace tempoit {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& active_sink() {
    static LogSink sink;
    return sink;
}

const char* level_label(LogVerbosity level) {
    switch (level) {
        case LogVerbosity::Error:
            return "error";
        case LogVerbosity::Warn:
            return "warn";
        case LogVerbosity::Info:
            return "info";
        case LogVerbosity::Debug:
            break;
    }
    return "debug";
}

} // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_verbosity_from_config(const TempoConfig& config) {
    if (config.verbose) {
        set_log_verbosity(LogVerbosity::Debug);
        return;
    }
    if (config.profile) {
        set_log_verbosity(LogVerbosity::Info);
        return;
    }
    set_log_verbosity(LogVerbosity::Warn);
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    active_sink() = std::move(sink);
}

void log_line(LogVerbosity level,
              const std::string& message,
              const char* file,
              int line,
              const char* func) {
    std::ostringstream formatted;
    formatted << "[TempoIt][" << level_label(level) << "]";
    if (level == LogVerbosity::Error) {
        formatted << "[" << (file ? file : "") << ":" << line << " " << (func ? func : "")
                  << "]";
    }
    formatted << " " << message;

    std::lock_guard<std::mutex> lock(sink_mutex());
    if (active_sink()) {
        active_sink()(level, formatted.str());
        return;
    }
    std::cerr << formatted.str() << "\n";
}

} // namespace tempoit
