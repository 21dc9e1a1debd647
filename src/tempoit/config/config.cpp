//
//  config.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/config.h"

#include "tempoit/logging.hpp"
#include "tempoit/tempo.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tempoit {
namespace {

constexpr std::size_t kMaxHistogramSmooth = 255;
constexpr double kMaxSmoothingFrames = 65536.0;
constexpr double kMaxBufferFrames = 1048576.0;
constexpr double kMaxInterval = 4096.0;

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

// Option keys accept '-' and '_' interchangeably.
std::string normalize_key(const std::string& key) {
    std::string out = to_lower(trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool parse_bool(const std::string& text, bool* out) {
    const std::string value = to_lower(trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        *out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        *out = false;
        return true;
    }
    return false;
}

} // namespace

bool parse_double(const std::string& text, double* out) {
    const std::string value = trim(text);
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end == value.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    *out = parsed;
    return true;
}

bool parse_size(const std::string& text, std::size_t* out) {
    const std::string value = trim(text);
    if (value.empty() || value[0] == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return false;
    }
    *out = static_cast<std::size_t>(parsed);
    return true;
}

bool parse_method(const std::string& name, TempoConfig::Method* method) {
    const std::string key = to_lower(trim(name));
    if (key == "comb" || key == "comb-filter" || key == "comb_filter") {
        *method = TempoConfig::Method::CombFilter;
        return true;
    }
    if (key == "acf" || key == "autocorrelation" || key == "autocorr") {
        *method = TempoConfig::Method::Autocorrelation;
        return true;
    }
    return false;
}

bool parse_output_format(const std::string& name, OutputFormat* format) {
    const std::string key = to_lower(trim(name));
    if (key == "normal") {
        *format = OutputFormat::Normal;
        return true;
    }
    if (key == "mirex") {
        *format = OutputFormat::Mirex;
        return true;
    }
    if (key == "raw" || key == "all") {
        *format = OutputFormat::Raw;
        return true;
    }
    return false;
}

const char* method_name(TempoConfig::Method method) {
    switch (method) {
        case TempoConfig::Method::Autocorrelation:
            return "acf";
        case TempoConfig::Method::CombFilter:
            break;
    }
    return "comb";
}

const char* output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Mirex:
            return "mirex";
        case OutputFormat::Raw:
            return "raw";
        case OutputFormat::Normal:
            break;
    }
    return "normal";
}

std::vector<std::string> config_option_names() {
    return {"method",
            "min_bpm",
            "max_bpm",
            "act_smooth",
            "hist_smooth",
            "hist_buffer",
            "alpha",
            "frame_rate",
            "output_format",
            "max_estimates",
            "fallback_bpm",
            "verbose",
            "profile"};
}

bool validate_config(const TempoConfig& config, std::string* error) {
    if (!std::isfinite(config.frame_rate) || config.frame_rate <= 0.0) {
        set_error(error, "Invalid configuration: frame_rate must be positive.");
        return false;
    }
    if (!std::isfinite(config.min_bpm) || config.min_bpm <= 0.0f) {
        set_error(error, "Invalid configuration: min_bpm must be positive.");
        return false;
    }
    if (!std::isfinite(config.max_bpm) || config.min_bpm >= config.max_bpm) {
        set_error(error, "Invalid configuration: min_bpm must be below max_bpm.");
        return false;
    }
    if (!std::isfinite(config.alpha) || config.alpha < 0.0f || config.alpha > 1.0f) {
        set_error(error, "Invalid configuration: alpha must lie within [0, 1].");
        return false;
    }
    if (!std::isfinite(config.act_smooth) || config.act_smooth < 0.0) {
        set_error(error, "Invalid configuration: act_smooth must not be negative.");
        return false;
    }
    if (!std::isfinite(config.hist_buffer) || config.hist_buffer <= 0.0) {
        set_error(error, "Invalid configuration: hist_buffer must be positive.");
        return false;
    }
    if (!std::isfinite(config.fallback_bpm) || config.fallback_bpm <= 0.0f) {
        set_error(error, "Invalid configuration: fallback_bpm must be positive.");
        return false;
    }

    if (config.hist_smooth > kMaxHistogramSmooth) {
        std::ostringstream message;
        message << "Invalid configuration: hist_smooth must not exceed " << kMaxHistogramSmooth
                << " buckets.";
        set_error(error, message.str());
        return false;
    }
    if (config.act_smooth * config.frame_rate > kMaxSmoothingFrames) {
        set_error(error, "Invalid configuration: act_smooth spans too many activation frames.");
        return false;
    }
    if (config.hist_buffer * config.frame_rate > kMaxBufferFrames) {
        set_error(error, "Invalid configuration: hist_buffer spans too many activation frames.");
        return false;
    }
    if ((60.0 * config.frame_rate) / config.min_bpm > kMaxInterval) {
        std::ostringstream message;
        message << "Invalid configuration: tempo range " << config.min_bpm << "-"
                << config.max_bpm << " BPM spans too many beat intervals at "
                << config.frame_rate << " fps.";
        set_error(error, message.str());
        return false;
    }

    const IntervalRange range =
        candidate_interval_range(config.frame_rate, config.min_bpm, config.max_bpm);
    if (range.max_interval < range.min_interval + 2) {
        std::ostringstream message;
        message << "Invalid configuration: tempo range " << config.min_bpm << "-"
                << config.max_bpm << " BPM spans too few beat intervals at "
                << config.frame_rate << " fps.";
        set_error(error, message.str());
        return false;
    }
    return true;
}

bool apply_config_option(TempoConfig& config,
                         const std::string& key,
                         const std::string& value,
                         std::string* error) {
    const std::string name = normalize_key(key);
    double number = 0.0;
    std::size_t count = 0;
    bool flag = false;

    auto bad_value = [&](const char* expected) {
        set_error(error,
                  "Invalid value '" + value + "' for option '" + name + "' (expected " +
                      expected + ").");
        return false;
    };

    if (name == "method") {
        if (!parse_method(value, &config.method)) {
            return bad_value("comb or acf");
        }
        return true;
    }
    if (name == "output_format" || name == "format") {
        if (!parse_output_format(value, &config.output_format)) {
            return bad_value("normal, mirex or raw");
        }
        return true;
    }
    if (name == "min_bpm" || name == "max_bpm" || name == "alpha" || name == "fallback_bpm") {
        if (!parse_double(value, &number)) {
            return bad_value("a number");
        }
        const float as_float = static_cast<float>(number);
        if (name == "min_bpm") {
            config.min_bpm = as_float;
        } else if (name == "max_bpm") {
            config.max_bpm = as_float;
        } else if (name == "alpha") {
            config.alpha = as_float;
        } else {
            config.fallback_bpm = as_float;
        }
        return true;
    }
    if (name == "act_smooth" || name == "hist_buffer" || name == "frame_rate" || name == "fps") {
        if (!parse_double(value, &number)) {
            return bad_value("a number");
        }
        if (name == "act_smooth") {
            config.act_smooth = number;
        } else if (name == "hist_buffer") {
            config.hist_buffer = number;
        } else {
            config.frame_rate = number;
        }
        return true;
    }
    if (name == "hist_smooth" || name == "max_estimates") {
        if (!parse_size(value, &count)) {
            return bad_value("a non-negative integer");
        }
        if (name == "hist_smooth") {
            config.hist_smooth = count;
        } else {
            config.max_estimates = count;
        }
        return true;
    }
    if (name == "verbose" || name == "profile") {
        if (!parse_bool(value, &flag)) {
            return bad_value("true or false");
        }
        if (name == "verbose") {
            config.verbose = flag;
        } else {
            config.profile = flag;
        }
        return true;
    }

    set_error(error, "Unknown option '" + key + "'.");
    return false;
}

bool load_config_file(const std::string& path, TempoConfig& config, std::string* error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        set_error(error, "Failed to open config file: " + path);
        return false;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        const std::size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            set_error(error,
                      path + ":" + std::to_string(line_number) + ": expected key=value.");
            return false;
        }
        std::string option_error;
        if (!apply_config_option(config, line.substr(0, eq), line.substr(eq + 1), &option_error)) {
            set_error(error, path + ":" + std::to_string(line_number) + ": " + option_error);
            return false;
        }
    }
    TEMPOIT_LOG_DEBUG("Config: loaded " << line_number << " lines from " << path);
    return true;
}

} // namespace tempoit
