//
//  comb_filter.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "comb_filter.h"

#include "tempoit/histogram.h"
#include "tempoit/logging.hpp"
#include "tempoit/tempo.h"

#include <algorithm>

namespace tempoit {
namespace detail {

CombFilterBank::CombFilterBank(double alpha, std::size_t min_interval, std::size_t max_interval)
    : alpha_(alpha),
      min_interval_(std::max<std::size_t>(1, min_interval)),
      max_interval_(std::max(min_interval_, max_interval)) {
    const std::size_t count = max_interval_ - min_interval_ + 1;
    offsets_.reserve(count);
    cursors_.assign(count, 0);
    std::size_t total = 0;
    for (std::size_t tau = min_interval_; tau <= max_interval_; ++tau) {
        offsets_.push_back(total);
        total += tau;
    }
    arena_.assign(total, 0.0);
}

void CombFilterBank::process(double value, std::vector<double>& outputs) {
    outputs.resize(offsets_.size());
    for (std::size_t k = 0; k < offsets_.size(); ++k) {
        const std::size_t tau = min_interval_ + k;
        double& slot = arena_[offsets_[k] + cursors_[k]];
        const double y = value + alpha_ * slot;
        slot = y;
        outputs[k] = y;
        if (++cursors_[k] == tau) {
            cursors_[k] = 0;
        }
    }
}

void CombFilterBank::reset() {
    std::fill(arena_.begin(), arena_.end(), 0.0);
    std::fill(cursors_.begin(), cursors_.end(), 0);
}

} // namespace detail

TempoHistogram interval_histogram_comb(const std::vector<double>& signal,
                                       double alpha,
                                       std::size_t min_interval,
                                       std::size_t max_interval,
                                       const CancelCheck& cancel) {
    detail::CombFilterBank bank(alpha, min_interval, max_interval);
    TempoHistogram histogram(bank.min_interval(), bank.max_interval());

    constexpr std::size_t kCancelPollFrames = 256;
    std::vector<double> outputs;
    for (std::size_t t = 0; t < signal.size(); ++t) {
        if (cancel && (t % kCancelPollFrames) == 0 && cancel()) {
            TEMPOIT_LOG_DEBUG("Comb: cancelled at frame " << t << "/" << signal.size());
            return TempoHistogram(bank.min_interval(), bank.max_interval());
        }
        bank.process(signal[t], outputs);
        const double peak = *std::max_element(outputs.begin(), outputs.end());
        if (peak <= 0.0) {
            continue;
        }
        // Every filter reaching the frame maximum is credited.
        for (std::size_t k = 0; k < outputs.size(); ++k) {
            if (outputs[k] == peak) {
                histogram.add(bank.min_interval() + k, peak);
            }
        }
    }
    return histogram;
}

} // namespace tempoit
