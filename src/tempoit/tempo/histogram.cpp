//
//  histogram.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/histogram.h"

#include "tempoit/tempo.h"

#include <algorithm>
#include <numeric>

namespace tempoit {

TempoHistogram::TempoHistogram(std::size_t min_interval, std::size_t max_interval)
    : min_interval_(min_interval),
      max_interval_(std::max(min_interval, max_interval)),
      bins_(max_interval_ - min_interval_ + 1, 0.0) {}

bool TempoHistogram::add(std::size_t interval, double strength) {
    if (bins_.empty() || interval < min_interval_ || interval > max_interval_) {
        return false;
    }
    bins_[interval - min_interval_] += strength;
    return true;
}

bool TempoHistogram::merge(const TempoHistogram& other) {
    if (other.min_interval_ != min_interval_ || other.max_interval_ != max_interval_ ||
        other.bins_.size() != bins_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < bins_.size(); ++i) {
        bins_[i] += other.bins_[i];
    }
    return true;
}

void TempoHistogram::clear() {
    std::fill(bins_.begin(), bins_.end(), 0.0);
}

TempoHistogram TempoHistogram::smoothed(std::size_t window) const {
    TempoHistogram out = *this;
    if (window > 1 && !bins_.empty()) {
        out.bins_ = smooth_histogram(bins_, window);
    }
    return out;
}

std::vector<HistogramPeak> TempoHistogram::peaks(std::size_t top_k) const {
    std::vector<HistogramPeak> found;
    const std::size_t n = bins_.size();
    std::size_t i = 1;
    while (i + 1 < n) {
        // A run of equal buckets is one peak, reported at its longest interval.
        std::size_t end = i;
        while (end + 1 < n && bins_[end + 1] == bins_[i]) {
            ++end;
        }
        const double v = bins_[i];
        if (end + 1 < n && v > bins_[i - 1] && v > bins_[end + 1]) {
            found.push_back({min_interval_ + end, v});
        }
        i = end + 1;
    }

    std::sort(found.begin(), found.end(), [](const HistogramPeak& a, const HistogramPeak& b) {
        if (a.strength != b.strength) {
            return a.strength > b.strength;
        }
        return a.interval > b.interval;
    });

    if (top_k > 0 && found.size() > top_k) {
        found.resize(top_k);
    }
    return found;
}

double TempoHistogram::value(std::size_t interval) const {
    if (bins_.empty() || interval < min_interval_ || interval > max_interval_) {
        return 0.0;
    }
    return bins_[interval - min_interval_];
}

double TempoHistogram::total() const {
    return std::accumulate(bins_.begin(), bins_.end(), 0.0);
}

double TempoHistogram::max_value() const {
    if (bins_.empty()) {
        return 0.0;
    }
    return *std::max_element(bins_.begin(), bins_.end());
}

std::size_t TempoHistogram::argmax() const {
    if (bins_.empty()) {
        return 0;
    }
    // Equal maxima resolve toward the slowest tempo, as in peaks().
    std::size_t best = 0;
    for (std::size_t i = 1; i < bins_.size(); ++i) {
        if (bins_[i] >= bins_[best]) {
            best = i;
        }
    }
    return min_interval_ + best;
}

double bpm_for_interval(double interval, double fps) {
    if (interval <= 0.0) {
        return 0.0;
    }
    return (60.0 * fps) / interval;
}

} // namespace tempoit
