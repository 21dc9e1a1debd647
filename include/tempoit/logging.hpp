//
//  logging.hpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace tempoit {

struct TempoConfig;

/// @brief Logging level policy for TempoIt.
///
/// Usage contract:
/// - `Error`: hard failures that prevent the requested operation, including
///   a failed batch item.
/// - `Warn`: degraded behavior, fallback estimates, invalid/missing runtime
///   inputs, or any suspicious condition users should see in non-verbose mode.
/// - `Info`: high-level lifecycle/profiling summaries (e.g. timing lines).
/// - `Debug`: histogram peaks, candidate scores, and internal traces.
///
/// Important:
/// - `Warn` and `Error` logs must never be additionally gated by local flags
///   such as ad-hoc local booleans; global logger level controls visibility.
/// - Batch workers log concurrently; every line is emitted atomically.
enum class LogVerbosity {
    /// @brief Hard failure; requested operation cannot be completed.
    Error = 0,
    /// @brief Recoverable issue, fallback, or suspicious condition.
    Warn = 1,
    /// @brief Operational summary and profiling information.
    Info = 2,
    /// @brief Detailed internal diagnostics and trace data.
    Debug = 3
};

/// @brief Receives each formatted log line (without trailing newline).
using LogSink = std::function<void(LogVerbosity level, const std::string& line)>;

/// @brief Set the current global TempoIt log verbosity.
void set_log_verbosity(LogVerbosity level);

/// @brief Get the current global TempoIt log verbosity.
LogVerbosity get_log_verbosity();

/// @brief Configure TempoIt log verbosity from config flags.
void set_log_verbosity_from_config(const TempoConfig& config);

/// @brief Replace the stderr sink; an empty sink restores stderr.
void set_log_sink(LogSink sink);

/// @brief Emit one line through the active sink.
void log_line(LogVerbosity level,
              const std::string& message,
              const char* file,
              int line,
              const char* func);

} // namespace tempoit

inline constexpr tempoit::LogVerbosity tempoit_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return tempoit::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return tempoit::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return tempoit::LogVerbosity::Info;
    }
    return tempoit::LogVerbosity::Debug;
}

inline bool tempoit_should_log(const char* level) {
    const auto current = tempoit::get_log_verbosity();
    const auto severity = tempoit_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void tempoit_log_multiline_impl(const char* level,
                                       const std::string& message,
                                       const char* file,
                                       int line,
                                       const char* func) {
    const auto severity = tempoit_severity_for_tag(level ? level : "");
    if (message.empty()) {
        tempoit::log_line(severity, message, file, line, func);
        return;
    }

    std::size_t start = 0;
    while (start <= message.size()) {
        const std::size_t end = message.find('\n', start);
        const std::size_t len =
            (end == std::string::npos) ? (message.size() - start) : (end - start);
        const std::string line_msg = message.substr(start, len);
        if (!line_msg.empty()) {
            tempoit::log_line(severity, line_msg, file, line, func);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

namespace tempoit {

/// @brief Stream-style logger adapter for building log messages across many statements.
class LogStream {
public:
    LogStream(const char* level, const char* file, int line, const char* func)
        : level_(level),
          file_(file),
          line_(line),
          func_(func),
          enabled_(tempoit_should_log(level)) {}

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (enabled_) {
            manip(stream_);
        }
        return *this;
    }

    ~LogStream() {
        if (!enabled_) {
            return;
        }
        tempoit_log_multiline_impl(level_, stream_.str(), file_, line_, func_);
    }

private:
    const char* level_ = nullptr;
    const char* file_ = nullptr;
    int line_ = 0;
    const char* func_ = nullptr;
    bool enabled_ = false;
    std::ostringstream stream_;
};

} // namespace tempoit

#define TEMPOIT_LOG(level, message)                                              \
    do {                                                                         \
        if (tempoit_should_log(level)) {                                         \
            std::ostringstream _tempoit_log_stream;                              \
            _tempoit_log_stream << message;                                      \
            tempoit_log_multiline_impl(level,                                    \
                                       _tempoit_log_stream.str(),                \
                                       __FILE__,                                 \
                                       __LINE__,                                 \
                                       __func__);                                \
        }                                                                        \
    } while (0)

#define TEMPOIT_LOG_STREAM(level) ::tempoit::LogStream(level, __FILE__, __LINE__, __func__)
#define TEMPOIT_LOG_ERROR_STREAM() TEMPOIT_LOG_STREAM("error")
#define TEMPOIT_LOG_WARN_STREAM() TEMPOIT_LOG_STREAM("warn")
#define TEMPOIT_LOG_INFO_STREAM() TEMPOIT_LOG_STREAM("info")
#define TEMPOIT_LOG_DEBUG_STREAM() TEMPOIT_LOG_STREAM("debug")

#define TEMPOIT_LOG_ERROR(message) TEMPOIT_LOG("error", message)
#define TEMPOIT_LOG_WARN(message) TEMPOIT_LOG("warn", message)
#define TEMPOIT_LOG_INFO(message) TEMPOIT_LOG("info", message)
#define TEMPOIT_LOG_DEBUG(message) TEMPOIT_LOG("debug", message)
