//
//  tempo_estimator_test.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-17.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "activation_test_utils.h"

#include "tempoit/config.h"
#include "tempoit/logging.hpp"
#include "tempoit/tempo.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

using Method = tempoit::TempoConfig::Method;

bool fail(const std::string& message) {
    std::cerr << "Tempo estimator test failed: " << message << "\n";
    return false;
}

tempoit::TempoConfig config_for(Method method) {
    tempoit::TempoConfig config;
    config.method = method;
    return config;
}

bool estimate(const std::vector<float>& values,
              const tempoit::TempoConfig& config,
              tempoit::TempoEstimate* out,
              const std::string& label) {
    std::string error;
    if (!tempoit::estimate_tempo(tempoit::tests::make_activation(values, config.frame_rate), config,
                                 out, &error)) {
        return fail(label + ": " + error);
    }
    if (out->tempi.empty()) {
        return fail(label + ": no tempo reported.");
    }
    return true;
}

bool check_top(const std::vector<float>& values,
               const tempoit::TempoConfig& config,
               double expected_bpm,
               double tolerance,
               const std::string& label) {
    tempoit::TempoEstimate result;
    if (!estimate(values, config, &result, label)) {
        return false;
    }
    const double bpm = result.tempi.front().bpm;
    if (std::fabs(bpm - expected_bpm) > tolerance) {
        return fail(label + " (" + tempoit::method_name(config.method) + "): expected " +
                    std::to_string(expected_bpm) + " BPM, got " + std::to_string(bpm));
    }
    if (result.fallback) {
        return fail(label + ": periodic input must not use the fallback.");
    }
    return true;
}

bool check_ranked(const tempoit::TempoEstimate& result,
                  const tempoit::TempoConfig& config,
                  const std::string& label) {
    double sum = 0.0;
    for (std::size_t i = 0; i < result.tempi.size(); ++i) {
        const auto& tempo = result.tempi[i];
        if (tempo.bpm < config.min_bpm - 1e-9 || tempo.bpm > config.max_bpm + 1e-9) {
            return fail(label + ": tempo " + std::to_string(tempo.bpm) + " outside the BPM range.");
        }
        if (tempo.strength < 0.0) {
            return fail(label + ": negative strength.");
        }
        if (i > 0 && tempo.strength > result.tempi[i - 1].strength) {
            return fail(label + ": tempi not ranked by strength.");
        }
        sum += tempo.strength;
    }
    if (sum > 1.0 + 1e-9) {
        return fail(label + ": strengths sum above 1.");
    }
    return true;
}

bool test_impulse_trains() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        const auto config = config_for(method);
        if (!check_top(tempoit::tests::impulse_train(50, 3000), config, 120.0, 0.5, "period 50") ||
            !check_top(tempoit::tests::impulse_train(40, 3000), config, 150.0, 0.5, "period 40") ||
            !check_top(tempoit::tests::impulse_train(60, 3000), config, 100.0, 0.5, "period 60")) {
            return false;
        }
    }
    return true;
}

bool test_fractional_period() {
    // 128 BPM at 100 fps is a period of 46.875 frames.
    const auto values = tempoit::tests::fractional_impulse_train(46.875, 3000);
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        if (!check_top(values, config_for(method), 128.0, 1.5, "128 BPM")) {
            return false;
        }
    }
    return true;
}

bool test_offset_train_over_noise_floor() {
    const auto values = tempoit::tests::impulse_train(50, 3000, 7, 0.05f);
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        if (!check_top(values, config_for(method), 120.0, 0.5, "offset with floor")) {
            return false;
        }
    }
    return true;
}

bool test_other_frame_rate() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        auto config = config_for(method);
        config.frame_rate = 50.0;
        if (!check_top(tempoit::tests::impulse_train(25, 1500), config, 120.0, 0.5, "50 fps")) {
            return false;
        }
    }
    return true;
}

bool test_ranking_and_truncation() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        auto config = config_for(method);
        tempoit::TempoEstimate result;
        if (!estimate(tempoit::tests::impulse_train(50, 3000), config, &result, "ranked")) {
            return false;
        }
        if (result.tempi.size() != 2) {
            return fail("default max_estimates should keep two tempi.");
        }
        if (!check_ranked(result, config, "ranked")) {
            return false;
        }

        config.max_estimates = 0;
        tempoit::TempoEstimate all;
        if (!estimate(tempoit::tests::impulse_train(50, 3000), config, &all, "all peaks")) {
            return false;
        }
        if (all.tempi.size() < 2 || !check_ranked(all, config, "all peaks")) {
            return false;
        }
        double sum = 0.0;
        for (const auto& tempo : all.tempi) {
            sum += tempo.strength;
        }
        if (std::fabs(sum - 1.0) > 1e-9) {
            return fail("all peaks should carry the full strength.");
        }
        if (all.tempi[0].bpm != result.tempi[0].bpm || all.tempi[1].bpm != result.tempi[1].bpm) {
            return fail("truncation should keep the head of the full ranking.");
        }
    }

    // Autocorrelation keeps both octaves of a clean train side by side.
    tempoit::TempoEstimate acf;
    if (!estimate(tempoit::tests::impulse_train(50, 3000), config_for(Method::Autocorrelation), &acf,
                  "octaves")) {
        return false;
    }
    if (std::fabs(acf.tempi[1].bpm - 60.0) > 0.5) {
        return fail("autocorrelation should report the half tempo second.");
    }
    return true;
}

bool test_short_activation() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        const auto config = config_for(method);
        // Shorter than the slowest candidate interval and than the histogram buffer.
        for (std::size_t frames : {60u, 120u, 400u}) {
            tempoit::TempoEstimate result;
            const std::string label = "short " + std::to_string(frames);
            if (!estimate(tempoit::tests::impulse_train(50, frames), config, &result, label)) {
                return false;
            }
            if (!check_ranked(result, config, label)) {
                return false;
            }
            if (std::fabs(result.tempi.front().bpm - 120.0) > 6.0) {
                return fail(label + ": expected about 120 BPM, got " +
                            std::to_string(result.tempi.front().bpm));
            }
        }
    }
    return true;
}

bool test_fallback_for_silence() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        auto config = config_for(method);
        for (const auto& values : {std::vector<float>(), std::vector<float>(800, 0.0f)}) {
            tempoit::TempoEstimate result;
            std::string error;
            if (!tempoit::estimate_tempo(tempoit::tests::make_activation(values), config, &result,
                                         &error)) {
                return fail("silence should not be an error: " + error);
            }
            if (!result.fallback || result.tempi.size() != 1 || result.tempi[0].bpm != 120.0 ||
                result.tempi[0].strength != 0.0) {
                return fail("silence should report the 120 BPM fallback with strength 0.");
            }
        }

        config.min_bpm = 130.0f;
        config.max_bpm = 200.0f;
        tempoit::TempoEstimate clamped;
        std::string error;
        if (!tempoit::estimate_tempo(tempoit::tests::make_activation({}), config, &clamped, &error) ||
            clamped.tempi[0].bpm != 130.0) {
            return fail("fallback should be clamped into the BPM range.");
        }
    }
    return true;
}

bool test_constant_activation_uses_maximum() {
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        const auto config = config_for(method);
        tempoit::TempoEstimate result;
        if (!estimate(std::vector<float>(500, 0.5f), config, &result, "constant")) {
            return false;
        }
        if (result.fallback || result.tempi.size() != 1 || result.tempi[0].strength != 1.0) {
            return fail("constant activation should report one tempo with strength 1.");
        }
        if (std::fabs(result.tempi[0].bpm - 250.0) > 1e-9) {
            return fail("constant activation should resolve to the fastest tempo, got " +
                        std::to_string(result.tempi[0].bpm));
        }
    }
    return true;
}

bool test_rejects_bad_input() {
    const auto config = config_for(Method::CombFilter);
    tempoit::TempoEstimate result;
    std::string error;

    auto values = tempoit::tests::impulse_train(50, 500);
    values[10] = -0.25f;
    if (tempoit::estimate_tempo(tempoit::tests::make_activation(values), config, &result, &error)) {
        return fail("negative activation should be rejected.");
    }

    values[10] = std::nanf("");
    if (tempoit::estimate_tempo(tempoit::tests::make_activation(values), config, &result, &error)) {
        return fail("NaN activation should be rejected.");
    }

    const auto mismatched = tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 500), 44.1);
    if (tempoit::estimate_tempo(mismatched, config, &result, &error)) {
        return fail("frame rate mismatch should be rejected.");
    }
    if (error.find("frame rate") == std::string::npos) {
        return fail("mismatch error should mention the frame rate, got: " + error);
    }

    // An oversized smoothing window is a configuration error, not a guess.
    auto wide = config;
    wide.hist_smooth = 1200;
    if (tempoit::estimate_tempo(tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 3000)),
                                wide, &result, &error) ||
        error.find("hist_smooth") == std::string::npos) {
        return fail("hist_smooth 1200 should be rejected, got: " + error);
    }

    // Unknown frame rate adopts the configured one.
    const auto unknown = tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 3000), 0.0);
    if (!tempoit::estimate_tempo(unknown, config, &result, &error) ||
        std::fabs(result.tempi[0].bpm - 120.0) > 0.5) {
        return fail("activation without fps should use the configured frame rate.");
    }

    auto invalid = config;
    invalid.min_bpm = 300.0f;
    if (tempoit::estimate_tempo(tempoit::tests::make_activation(values), invalid, &result, &error)) {
        return fail("invalid configuration should be rejected.");
    }
    return true;
}

bool test_deterministic() {
    const auto values = tempoit::tests::fractional_impulse_train(46.875, 2500);
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        auto config = config_for(method);
        config.max_estimates = 0;
        tempoit::TempoEstimate first;
        tempoit::TempoEstimate second;
        if (!estimate(values, config, &first, "first run") ||
            !estimate(values, config, &second, "second run")) {
            return false;
        }
        if (first.tempi.size() != second.tempi.size()) {
            return fail("repeated runs differ in size.");
        }
        for (std::size_t i = 0; i < first.tempi.size(); ++i) {
            if (first.tempi[i].bpm != second.tempi[i].bpm ||
                first.tempi[i].strength != second.tempi[i].strength) {
                return fail("repeated runs differ.");
            }
        }
    }
    return true;
}

bool test_analysis_exposes_histograms() {
    auto config = config_for(Method::CombFilter);
    config.hist_smooth = 1;
    tempoit::TempoAnalysis analysis;
    std::string error;
    if (!tempoit::analyze_tempo(tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 2000)),
                                config, &analysis, &error)) {
        return fail("analysis: " + error);
    }
    if (analysis.histogram.min_interval() != 24 || analysis.histogram.max_interval() != 150) {
        return fail("analysis histogram should span the candidate intervals.");
    }
    if (analysis.smoothed_histogram.bins() != analysis.histogram.bins()) {
        return fail("hist_smooth 1 should leave the histogram untouched.");
    }
    if (analysis.smoothed_activation.size() != 2000) {
        return fail("smoothed activation should keep the frame count.");
    }
    if (analysis.histogram.total() <= 0.0 || analysis.estimate.tempi.empty()) {
        return fail("analysis should carry evidence and an estimate.");
    }
    return true;
}

bool test_info_log_reports_timing() {
    std::vector<std::string> lines;
    tempoit::set_log_verbosity(tempoit::LogVerbosity::Info);
    tempoit::set_log_sink([&lines](tempoit::LogVerbosity, const std::string& line) {
        lines.push_back(line);
    });
    tempoit::TempoEstimate result;
    std::string error;
    const bool ok = tempoit::estimate_tempo(
        tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 1000)),
        config_for(Method::CombFilter), &result, &error);
    tempoit::set_log_sink({});
    tempoit::set_log_verbosity(tempoit::LogVerbosity::Warn);

    if (!ok) {
        return fail("estimation with info logging failed: " + error);
    }
    for (const auto& line : lines) {
        if (line.find("Tempo: method=comb frames=1000 intervals=24-150 ms=") != std::string::npos) {
            return true;
        }
    }
    return fail("info logging should summarise the run with its timing.");
}

bool test_cancel() {
    const auto activation = tempoit::tests::make_activation(tempoit::tests::impulse_train(50, 3000));
    for (Method method : {Method::CombFilter, Method::Autocorrelation}) {
        tempoit::TempoEstimate result;
        std::string error;
        if (tempoit::estimate_tempo(activation, config_for(method), &result, &error,
                                    []() { return true; })) {
            return fail("cancelled estimation should fail.");
        }
        if (error.find("cancelled") == std::string::npos) {
            return fail("cancel error should say so, got: " + error);
        }
    }
    return true;
}

} // namespace

int main() {
    if (!test_impulse_trains()) {
        return 1;
    }
    if (!test_fractional_period()) {
        return 1;
    }
    if (!test_offset_train_over_noise_floor()) {
        return 1;
    }
    if (!test_other_frame_rate()) {
        return 1;
    }
    if (!test_ranking_and_truncation()) {
        return 1;
    }
    if (!test_short_activation()) {
        return 1;
    }
    if (!test_fallback_for_silence()) {
        return 1;
    }
    if (!test_constant_activation_uses_maximum()) {
        return 1;
    }
    if (!test_rejects_bad_input()) {
        return 1;
    }
    if (!test_deterministic()) {
        return 1;
    }
    if (!test_analysis_exposes_histograms()) {
        return 1;
    }
    if (!test_info_log_reports_timing()) {
        return 1;
    }
    if (!test_cancel()) {
        return 1;
    }

    std::cout << "Tempo estimator test passed.\n";
    return 0;
}
