//
//  estimator.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "smoothing.h"

#include "tempoit/logging.hpp"
#include "tempoit/tempo.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

namespace tempoit {
namespace {

struct TempoEstimationContext {
    double fps = 0.0;
    IntervalRange range;
    std::size_t act_window = 0;
};

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

bool make_tempo_estimation_context(const ActivationFunction& activation,
                                   const TempoConfig& config,
                                   TempoEstimationContext& context,
                                   std::string* error) {
    if (!validate_config(config, error)) {
        return false;
    }

    context.fps = config.frame_rate;
    if (activation.fps > 0.0 && std::abs(activation.fps - config.frame_rate) > 1e-6) {
        std::ostringstream message;
        message << "Activation frame rate " << activation.fps
                << " fps does not match the configured " << config.frame_rate << " fps.";
        set_error(error, message.str());
        return false;
    }

    context.range = candidate_interval_range(context.fps, config.min_bpm, config.max_bpm);
    context.act_window = detail::smoothing_frames(config.act_smooth, context.fps);
    return true;
}

bool cancelled(const CancelCheck& cancel, std::string* error) {
    if (cancel && cancel()) {
        set_error(error, "Tempo estimation cancelled.");
        return true;
    }
    return false;
}

} // namespace

TempoEstimate fallback_estimate(const TempoConfig& config) {
    TempoEstimate estimate;
    double bpm = static_cast<double>(config.fallback_bpm);
    if (config.min_bpm < config.max_bpm) {
        bpm = std::clamp(bpm,
                         static_cast<double>(config.min_bpm),
                         static_cast<double>(config.max_bpm));
    }
    estimate.tempi.push_back({bpm, 0.0});
    estimate.fallback = true;
    return estimate;
}

TempoEstimate detect_tempo(const TempoHistogram& smoothed_histogram,
                           double fps,
                           const TempoConfig& config) {
    if (smoothed_histogram.empty() || smoothed_histogram.max_value() <= 0.0) {
        return fallback_estimate(config);
    }

    const std::vector<HistogramPeak> peaks = smoothed_histogram.peaks();
    TempoEstimate estimate;
    if (peaks.empty()) {
        // Evidence without a local maximum (e.g. a monotonic histogram).
        const std::size_t interval = smoothed_histogram.argmax();
        estimate.tempi.push_back({bpm_for_interval(static_cast<double>(interval), fps), 1.0});
        TEMPOIT_LOG_DEBUG("Tempo: no histogram peak, using maximum at interval " << interval);
        return estimate;
    }

    double sum = 0.0;
    for (const auto& peak : peaks) {
        sum += peak.strength;
    }

    const std::size_t keep = (config.max_estimates == 0)
        ? peaks.size()
        : std::min(config.max_estimates, peaks.size());
    estimate.tempi.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        const double bpm = bpm_for_interval(static_cast<double>(peaks[i].interval), fps);
        const double strength = (sum > 0.0) ? peaks[i].strength / sum : 0.0;
        estimate.tempi.push_back({bpm, strength});
    }

    {
        auto debug_stream = TEMPOIT_LOG_DEBUG_STREAM();
        debug_stream << "Tempo debug: peaks=" << peaks.size() << " kept=" << keep;
        for (const auto& tempo : estimate.tempi) {
            debug_stream << " " << tempo.bpm << "/" << tempo.strength;
        }
    }
    return estimate;
}

bool analyze_tempo(const ActivationFunction& activation,
                   const TempoConfig& config,
                   TempoAnalysis* analysis,
                   std::string* error,
                   const CancelCheck& cancel) {
    if (!analysis) {
        set_error(error, "No analysis output given.");
        return false;
    }

    TempoEstimationContext context;
    if (!make_tempo_estimation_context(activation, config, context, error)) {
        return false;
    }
    if (!validate_activation(activation, error)) {
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    TempoAnalysis result;
    result.fps = context.fps;
    result.histogram = TempoHistogram(context.range.min_interval, context.range.max_interval);
    result.smoothed_histogram = result.histogram;

    const bool silent =
        std::none_of(activation.values.begin(), activation.values.end(), [](float v) {
            return v > 0.0f;
        });
    if (silent) {
        result.estimate = fallback_estimate(config);
        TEMPOIT_LOG_WARN("Tempo: activation is "
                         << (activation.values.empty() ? "empty" : "all zero") << " ("
                         << activation.values.size() << " frames), reporting fallback "
                         << result.estimate.tempi.front().bpm << " BPM.");
        *analysis = std::move(result);
        return true;
    }

    result.smoothed_activation = smooth_activation(activation.values, context.act_window);
    if (cancelled(cancel, error)) {
        return false;
    }

    switch (config.method) {
        case TempoConfig::Method::Autocorrelation:
            result.histogram = interval_histogram_acf(result.smoothed_activation,
                                                      context.range.min_interval,
                                                      context.range.max_interval,
                                                      cancel);
            break;
        case TempoConfig::Method::CombFilter:
            result.histogram = interval_histogram_comb(result.smoothed_activation,
                                                       config.alpha,
                                                       context.range.min_interval,
                                                       context.range.max_interval,
                                                       cancel);
            break;
    }
    // The histogram builders return an empty histogram once cancelled.
    if (cancelled(cancel, error)) {
        return false;
    }

    result.smoothed_histogram = result.histogram.smoothed(config.hist_smooth);
    result.estimate = detect_tempo(result.smoothed_histogram, context.fps, config);
    if (result.estimate.fallback) {
        TEMPOIT_LOG_WARN("Tempo: no periodicity evidence in " << activation.values.size()
                         << " frames, reporting fallback "
                         << result.estimate.tempi.front().bpm << " BPM.");
    }

    const auto end = std::chrono::steady_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    TEMPOIT_LOG_INFO("Tempo: method=" << method_name(config.method)
                     << " frames=" << activation.values.size()
                     << " intervals=" << context.range.min_interval << "-"
                     << context.range.max_interval << " ms="
                     << elapsed_ms);

    *analysis = std::move(result);
    return true;
}

bool estimate_tempo(const ActivationFunction& activation,
                    const TempoConfig& config,
                    TempoEstimate* estimate,
                    std::string* error,
                    const CancelCheck& cancel) {
    if (!estimate) {
        set_error(error, "No estimate output given.");
        return false;
    }
    TempoAnalysis analysis;
    if (!analyze_tempo(activation, config, &analysis, error, cancel)) {
        return false;
    }
    *estimate = std::move(analysis.estimate);
    return true;
}

} // namespace tempoit
