//
//  comb_filter.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

namespace tempoit {
namespace detail {

/// @brief Bank of feedback comb filters `y[t] = x[t] + alpha * y[t - tau]`.
///
/// One filter per interval in `[min_interval, max_interval]`. The delay
/// lines of all filters live back to back in a single arena; filter `k`
/// owns `tau_k` slots starting at `offsets_[k]` and a write cursor that
/// wraps inside them. Each slot holds the output from exactly `tau_k`
/// frames ago.
class CombFilterBank {
public:
    CombFilterBank(double alpha, std::size_t min_interval, std::size_t max_interval);

    /// @brief Feed one frame; `outputs` receives one value per filter.
    void process(double value, std::vector<double>& outputs);

    void reset();

    std::size_t size() const {
        return offsets_.size();
    }
    std::size_t min_interval() const {
        return min_interval_;
    }
    std::size_t max_interval() const {
        return max_interval_;
    }
    double alpha() const {
        return alpha_;
    }

private:
    double alpha_ = 0.0;
    std::size_t min_interval_ = 0;
    std::size_t max_interval_ = 0;
    std::vector<double> arena_;
    std::vector<std::size_t> offsets_;
    std::vector<std::size_t> cursors_;
};

} // namespace detail
} // namespace tempoit
