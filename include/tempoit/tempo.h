//
//  tempo.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "tempoit/activation.h"
#include "tempoit/config.h"
#include "tempoit/histogram.h"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tempoit {

struct TempoCandidate {
    double bpm = 0.0;
    double strength = 0.0;
};

/// @brief Ranked tempo hypotheses, strongest first.
///
/// Strengths are non-negative and sum to at most 1. Octave related tempi
/// are kept as separate entries; resolving them is left to the output
/// format.
struct TempoEstimate {
    std::vector<TempoCandidate> tempi;
    // Set when the input carried no periodicity evidence at all.
    bool fallback = false;

    bool empty() const {
        return tempi.empty();
    }
};

struct TempoAnalysis {
    double fps = 0.0;
    std::vector<double> smoothed_activation;
    TempoHistogram histogram;
    TempoHistogram smoothed_histogram;
    TempoEstimate estimate;
};

/// @brief Polled during analysis; returning true aborts the run.
using CancelCheck = std::function<bool()>;

struct IntervalRange {
    std::size_t min_interval = 0;
    std::size_t max_interval = 0;
};

/// @brief Candidate beat intervals (frames) whose tempi lie inside the BPM range.
IntervalRange candidate_interval_range(double fps, double min_bpm, double max_bpm);

/// @brief Centered, Hamming-weighted moving average with unit gain.
std::vector<double> smooth_activation(const std::vector<float>& values, std::size_t window);
std::vector<double> smooth_signal(const std::vector<double>& values, std::size_t window);

/// @brief Centered binomial smoothing for histogram buckets.
///
/// Edges are mirrored, and an even window is widened by one bucket to keep
/// the kernel centered. The result never has more local maxima than the
/// input (for four or more buckets).
std::vector<double> smooth_histogram(const std::vector<double>& bins, std::size_t window);

TempoHistogram interval_histogram_acf(const std::vector<double>& signal,
                                      std::size_t min_interval,
                                      std::size_t max_interval,
                                      const CancelCheck& cancel = {});

TempoHistogram interval_histogram_comb(const std::vector<double>& signal,
                                       double alpha,
                                       std::size_t min_interval,
                                       std::size_t max_interval,
                                       const CancelCheck& cancel = {});

/// @brief Turn a smoothed interval histogram into ranked tempi.
TempoEstimate detect_tempo(const TempoHistogram& smoothed_histogram,
                           double fps,
                           const TempoConfig& config);

/// @brief Deterministic estimate for inputs without periodicity evidence.
TempoEstimate fallback_estimate(const TempoConfig& config);

/// @brief Full analysis including the raw and smoothed histograms.
bool analyze_tempo(const ActivationFunction& activation,
                   const TempoConfig& config,
                   TempoAnalysis* analysis,
                   std::string* error,
                   const CancelCheck& cancel = {});

bool estimate_tempo(const ActivationFunction& activation,
                    const TempoConfig& config,
                    TempoEstimate* estimate,
                    std::string* error,
                    const CancelCheck& cancel = {});

} // namespace tempoit
