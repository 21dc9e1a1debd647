//
//  config.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tempoit {

enum class OutputFormat {
    Normal,
    Mirex,
    Raw,
};

struct TempoConfig {
    enum class Method {
        Autocorrelation,
        CombFilter,
    };
    Method method = Method::CombFilter;
    float min_bpm = 40.0f;
    float max_bpm = 250.0f;
    // Activation pre-smoothing window in seconds.
    double act_smooth = 0.14;
    // Histogram smoothing window in buckets (intervals).
    std::size_t hist_smooth = 9;
    // Sliding window of the online estimator in seconds.
    double hist_buffer = 10.0;
    // Comb filter resonance factor.
    float alpha = 0.79f;
    double frame_rate = 100.0;
    OutputFormat output_format = OutputFormat::Normal;
    // Number of ranked tempi kept; 0 keeps every histogram peak.
    std::size_t max_estimates = 2;
    // Tempo reported for empty or all-zero activations.
    float fallback_bpm = 120.0f;
    bool verbose = false;
    bool profile = false;
};

/// @brief Check option ranges and the candidate interval span.
///
/// Fails for `min_bpm >= max_bpm`, non-positive bounds or frame rate,
/// `alpha` outside [0, 1], negative smoothing, a non-positive
/// `hist_buffer`, and BPM ranges that leave fewer than three candidate
/// intervals at the configured frame rate. Windows are bounded too:
/// `hist_smooth` up to 255 buckets, `act_smooth` up to 65536 frames,
/// `hist_buffer` up to 1048576 frames and the longest beat interval up to
/// 4096 frames.
bool validate_config(const TempoConfig& config, std::string* error);

/// @brief Apply a single `key=value` option, e.g. from the CLI or a config file.
bool apply_config_option(TempoConfig& config,
                         const std::string& key,
                         const std::string& value,
                         std::string* error);

/// @brief Apply `key=value` lines from a file. `#` starts a comment.
bool load_config_file(const std::string& path, TempoConfig& config, std::string* error);

/// @brief Strict number parsing: surrounding blanks are allowed, trailing text is not.
bool parse_double(const std::string& text, double* out);
bool parse_size(const std::string& text, std::size_t* out);

bool parse_method(const std::string& name, TempoConfig::Method* method);
bool parse_output_format(const std::string& name, OutputFormat* format);

const char* method_name(TempoConfig::Method method);
const char* output_format_name(OutputFormat format);

/// @brief Names of all options understood by `apply_config_option`.
std::vector<std::string> config_option_names();

} // namespace tempoit
