//
//  histogram.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

namespace tempoit {

struct HistogramPeak {
    std::size_t interval = 0;
    double strength = 0.0;
};

/// @brief Periodicity evidence per beat interval (frames).
///
/// Buckets cover `[min_interval, max_interval]`; bucket `tau` stands for
/// `60 * fps / tau` BPM, so a longer interval is a slower tempo.
/// Accumulation is purely additive; smoothing is a separate pass that
/// returns a new histogram and leaves this one untouched.
class TempoHistogram {
public:
    TempoHistogram() = default;
    TempoHistogram(std::size_t min_interval, std::size_t max_interval);

    /// @brief Add evidence to a bucket. Out-of-range buckets are rejected.
    bool add(std::size_t interval, double strength);

    /// @brief Add another histogram covering the same interval range.
    bool merge(const TempoHistogram& other);

    void clear();

    /// @brief Binomial moving average over `window` buckets.
    ///
    /// A window of 0 or 1 returns an identical copy. Smoothing never adds
    /// peaks.
    TempoHistogram smoothed(std::size_t window) const;

    /// @brief Strict local maxima, strongest first.
    ///
    /// A flat run of equal buckets that rises above both of its neighbours
    /// counts once, at its longest interval. The first and last bucket are
    /// never peaks. Equal strengths are
    /// ordered toward the slower tempo (longer interval) first. `top_k == 0`
    /// returns every peak.
    std::vector<HistogramPeak> peaks(std::size_t top_k = 0) const;

    double value(std::size_t interval) const;
    double total() const;
    double max_value() const;
    std::size_t argmax() const;

    std::size_t min_interval() const {
        return min_interval_;
    }
    std::size_t max_interval() const {
        return max_interval_;
    }
    std::size_t size() const {
        return bins_.size();
    }
    bool empty() const {
        return bins_.empty();
    }
    const std::vector<double>& bins() const {
        return bins_;
    }

private:
    std::size_t min_interval_ = 0;
    std::size_t max_interval_ = 0;
    std::vector<double> bins_;
};

double bpm_for_interval(double interval, double fps);

} // namespace tempoit
