//
//  config_test.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-17.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "activation_test_utils.h"

#include "tempoit/config.h"
#include "tempoit/logging.hpp"
#include "tempoit/preset.h"
#include "tempoit/tempo.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool fail(const std::string& message) {
    std::cerr << "Config test failed: " << message << "\n";
    return false;
}

bool test_defaults_are_valid() {
    const tempoit::TempoConfig config;
    std::string error;
    if (!tempoit::validate_config(config, &error)) {
        return fail("defaults rejected: " + error);
    }
    if (config.method != tempoit::TempoConfig::Method::CombFilter || config.min_bpm != 40.0f ||
        config.max_bpm != 250.0f || config.hist_smooth != 9 || config.alpha != 0.79f ||
        config.frame_rate != 100.0) {
        return fail("unexpected default values.");
    }

    const tempoit::IntervalRange range = tempoit::candidate_interval_range(100.0, 40.0, 250.0);
    if (range.min_interval != 24 || range.max_interval != 150) {
        return fail("default interval range should be 24-150, got " +
                    std::to_string(range.min_interval) + "-" + std::to_string(range.max_interval));
    }
    return true;
}

bool test_interval_range_stays_inside_bpm_bounds() {
    const double rates[] = {43.066, 50.0, 100.0, 172.27};
    for (double fps : rates) {
        const tempoit::IntervalRange range = tempoit::candidate_interval_range(fps, 60.0, 180.0);
        const double fastest = tempoit::bpm_for_interval(range.min_interval, fps);
        const double slowest = tempoit::bpm_for_interval(range.max_interval, fps);
        if (fastest > 180.0 + 1e-9 || slowest < 60.0 - 1e-9) {
            return fail("interval range leaves the BPM bounds at fps " + std::to_string(fps));
        }
    }
    return true;
}

bool test_rejects_invalid_configurations() {
    std::string error;

    tempoit::TempoConfig inverted;
    inverted.min_bpm = 200.0f;
    inverted.max_bpm = 100.0f;
    if (tempoit::validate_config(inverted, &error)) {
        return fail("min_bpm above max_bpm should be rejected.");
    }
    if (error.find("min_bpm") == std::string::npos) {
        return fail("inverted range error should mention min_bpm, got: " + error);
    }

    tempoit::TempoConfig equal;
    equal.min_bpm = 120.0f;
    equal.max_bpm = 120.0f;
    if (tempoit::validate_config(equal, &error)) {
        return fail("min_bpm equal to max_bpm should be rejected.");
    }

    tempoit::TempoConfig narrow;
    narrow.min_bpm = 245.0f;
    narrow.max_bpm = 250.0f;
    if (tempoit::validate_config(narrow, &error)) {
        return fail("a range with a single candidate interval should be rejected.");
    }

    tempoit::TempoConfig alpha;
    alpha.alpha = 1.5f;
    if (tempoit::validate_config(alpha, &error)) {
        return fail("alpha above 1 should be rejected.");
    }

    tempoit::TempoConfig fps;
    fps.frame_rate = 0.0;
    if (tempoit::validate_config(fps, &error)) {
        return fail("zero frame rate should be rejected.");
    }

    tempoit::TempoConfig buffer;
    buffer.hist_buffer = 0.0;
    if (tempoit::validate_config(buffer, &error)) {
        return fail("zero hist_buffer should be rejected.");
    }
    return true;
}

bool test_rejects_oversized_windows() {
    std::string error;

    tempoit::TempoConfig wide;
    if (!tempoit::apply_config_option(wide, "hist_smooth", "1200", &error)) {
        return fail("a large hist_smooth should parse: " + error);
    }
    if (tempoit::validate_config(wide, &error) || error.find("hist_smooth") == std::string::npos) {
        return fail("hist_smooth above 255 should be rejected, got: " + error);
    }
    wide.hist_smooth = 255;
    if (!tempoit::validate_config(wide, &error)) {
        return fail("hist_smooth 255 should still be accepted: " + error);
    }

    tempoit::TempoConfig smooth;
    smooth.act_smooth = 1e12;
    if (tempoit::validate_config(smooth, &error) || error.find("act_smooth") == std::string::npos) {
        return fail("a huge act_smooth should be rejected, got: " + error);
    }

    tempoit::TempoConfig buffer;
    buffer.hist_buffer = 1e9;
    if (tempoit::validate_config(buffer, &error) || error.find("hist_buffer") == std::string::npos) {
        return fail("a huge hist_buffer should be rejected, got: " + error);
    }

    tempoit::TempoConfig fast;
    fast.frame_rate = 1e7;
    fast.act_smooth = 0.0;
    fast.hist_buffer = 0.01;
    if (tempoit::validate_config(fast, &error) || error.find("too many") == std::string::npos) {
        return fail("a frame rate with too many beat intervals should be rejected, got: " + error);
    }
    return true;
}

bool test_strict_number_parsing() {
    double seconds = -1.0;
    std::size_t jobs = 0;
    if (!tempoit::parse_double(" 2.5 ", &seconds) || seconds != 2.5) {
        return fail("parse_double should accept surrounding blanks.");
    }
    if (tempoit::parse_double("5s", &seconds) || tempoit::parse_double("abc", &seconds) ||
        tempoit::parse_double("", &seconds)) {
        return fail("parse_double should reject trailing text and empty input.");
    }
    if (!tempoit::parse_size("4", &jobs) || jobs != 4) {
        return fail("parse_size should accept plain counts.");
    }
    if (tempoit::parse_size("abc", &jobs) || tempoit::parse_size("-2", &jobs) ||
        tempoit::parse_size("3.5", &jobs) || jobs != 4) {
        return fail("parse_size should reject junk and leave the output untouched.");
    }
    return true;
}

bool test_apply_options() {
    tempoit::TempoConfig config;
    std::string error;
    if (!tempoit::apply_config_option(config, "method", "acf", &error) ||
        config.method != tempoit::TempoConfig::Method::Autocorrelation) {
        return fail("method=acf not applied: " + error);
    }
    if (!tempoit::apply_config_option(config, "min-bpm", "60", &error) || config.min_bpm != 60.0f) {
        return fail("dashed key min-bpm not applied: " + error);
    }
    if (!tempoit::apply_config_option(config, "fps", "50", &error) || config.frame_rate != 50.0) {
        return fail("fps alias not applied: " + error);
    }
    if (!tempoit::apply_config_option(config, "format", "MIREX", &error) ||
        config.output_format != tempoit::OutputFormat::Mirex) {
        return fail("format alias not applied: " + error);
    }
    if (!tempoit::apply_config_option(config, "max_estimates", "0", &error) ||
        config.max_estimates != 0) {
        return fail("max_estimates not applied: " + error);
    }
    if (!tempoit::apply_config_option(config, "verbose", "yes", &error) || !config.verbose) {
        return fail("verbose not applied: " + error);
    }

    if (tempoit::apply_config_option(config, "hist_smooth", "-3", &error)) {
        return fail("negative hist_smooth should be rejected.");
    }
    if (tempoit::apply_config_option(config, "alpha", "0.5x", &error)) {
        return fail("trailing garbage should be rejected.");
    }
    if (tempoit::apply_config_option(config, "tempo", "120", &error)) {
        return fail("unknown option should be rejected.");
    }
    if (error.find("tempo") == std::string::npos) {
        return fail("unknown option error should name it, got: " + error);
    }
    return true;
}

bool test_option_names_round_trip() {
    for (const auto& name : tempoit::config_option_names()) {
        tempoit::TempoConfig config;
        std::string error;
        std::string value = "1";
        if (name == "method") {
            value = "comb";
        } else if (name == "output_format") {
            value = "raw";
        }
        if (!tempoit::apply_config_option(config, name, value, &error)) {
            return fail("listed option '" + name + "' not accepted: " + error);
        }
    }

    tempoit::TempoConfig::Method method;
    if (!tempoit::parse_method(tempoit::method_name(tempoit::TempoConfig::Method::Autocorrelation),
                               &method) ||
        method != tempoit::TempoConfig::Method::Autocorrelation) {
        return fail("method name does not parse back.");
    }
    tempoit::OutputFormat format;
    if (!tempoit::parse_output_format(tempoit::output_format_name(tempoit::OutputFormat::Raw),
                                      &format) ||
        format != tempoit::OutputFormat::Raw) {
        return fail("format name does not parse back.");
    }
    return true;
}

bool test_config_file() {
    const auto dir = tempoit::tests::make_temp_dir("tempoit_config_test");
    const std::string path = (dir / "tempo.conf").string();
    {
        std::ofstream out(path);
        out << "# tempo settings\n"
            << "method = acf\n"
            << "\n"
            << "max_bpm=180   # faster tempi are rare here\n"
            << "hist_smooth=7\n";
    }

    tempoit::TempoConfig config;
    std::string error;
    if (!tempoit::load_config_file(path, config, &error)) {
        return fail("config file: " + error);
    }
    if (config.method != tempoit::TempoConfig::Method::Autocorrelation || config.max_bpm != 180.0f ||
        config.hist_smooth != 7) {
        return fail("config file values not applied.");
    }

    const std::string bad_path = (dir / "bad.conf").string();
    {
        std::ofstream out(bad_path);
        out << "method=acf\n"
            << "alpha\n";
    }
    if (tempoit::load_config_file(bad_path, config, &error)) {
        return fail("line without '=' should be rejected.");
    }
    if (error.find(":2:") == std::string::npos) {
        return fail("config file error should carry the line number, got: " + error);
    }

    if (tempoit::load_config_file((dir / "missing.conf").string(), config, &error)) {
        return fail("missing config file should be rejected.");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return true;
}

bool test_presets() {
    const auto names = tempoit::tempo_preset_names();
    if (names.size() != 2) {
        return fail("expected two presets.");
    }
    for (const auto& name : names) {
        const auto preset = tempoit::make_tempo_preset(name);
        if (!preset || name != preset->name()) {
            return fail("preset '" + name + "' not constructible.");
        }
        tempoit::TempoConfig config;
        config.min_bpm = 500.0f;
        preset->apply(config);
        std::string error;
        if (!tempoit::validate_config(config, &error)) {
            return fail("preset '" + name + "' yields an invalid config: " + error);
        }
    }

    tempoit::TempoConfig config;
    tempoit::make_tempo_preset("ACF")->apply(config);
    if (config.method != tempoit::TempoConfig::Method::Autocorrelation || config.hist_smooth != 5) {
        return fail("acf preset should select autocorrelation with hist_smooth 5.");
    }
    if (tempoit::make_tempo_preset("dbn")) {
        return fail("unknown preset should not be constructible.");
    }
    return true;
}

bool test_log_verbosity_follows_config() {
    tempoit::TempoConfig config;
    config.verbose = true;
    tempoit::set_log_verbosity_from_config(config);
    if (tempoit::get_log_verbosity() != tempoit::LogVerbosity::Debug) {
        return fail("verbose should enable debug logging.");
    }
    config.verbose = false;
    config.profile = true;
    tempoit::set_log_verbosity_from_config(config);
    if (tempoit::get_log_verbosity() != tempoit::LogVerbosity::Info) {
        return fail("profile should enable info logging.");
    }

    std::vector<std::string> lines;
    tempoit::set_log_sink([&lines](tempoit::LogVerbosity, const std::string& line) {
        lines.push_back(line);
    });
    TEMPOIT_LOG_INFO("first\nsecond");
    TEMPOIT_LOG_DEBUG("hidden");
    tempoit::set_log_sink({});
    tempoit::set_log_verbosity(tempoit::LogVerbosity::Warn);

    if (lines.size() != 2 || lines[0] != "[TempoIt][info] first" ||
        lines[1] != "[TempoIt][info] second") {
        return fail("log sink should receive one line per message line at info level.");
    }
    return true;
}

} // namespace

int main() {
    if (!test_defaults_are_valid()) {
        return 1;
    }
    if (!test_interval_range_stays_inside_bpm_bounds()) {
        return 1;
    }
    if (!test_rejects_invalid_configurations()) {
        return 1;
    }
    if (!test_rejects_oversized_windows()) {
        return 1;
    }
    if (!test_strict_number_parsing()) {
        return 1;
    }
    if (!test_apply_options()) {
        return 1;
    }
    if (!test_option_names_round_trip()) {
        return 1;
    }
    if (!test_config_file()) {
        return 1;
    }
    if (!test_presets()) {
        return 1;
    }
    if (!test_log_verbosity_follows_config()) {
        return 1;
    }

    std::cout << "Config test passed.\n";
    return 0;
}
