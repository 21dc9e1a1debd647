//
//  stream.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "tempoit/config.h"
#include "tempoit/histogram.h"
#include "tempoit/tempo.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace tempoit {
namespace detail {
class CombFilterBank;
}

/// @brief Online tempo estimation over the last `hist_buffer` seconds.
///
/// Frames are smoothed causally (trailing window), so the stream never
/// needs to look ahead. A configuration failing `validate_config` yields a
/// stream that only ever reports the fallback estimate.
class TempoStream {
public:
    explicit TempoStream(const TempoConfig& config);
    ~TempoStream();

    TempoStream(const TempoStream&) = delete;
    TempoStream& operator=(const TempoStream&) = delete;

    void push(float value);
    void push(const float* values, std::size_t count);
    void push(const std::vector<float>& values) { push(values.data(), values.size()); }

    // Ranked tempi over the buffered window.
    TempoEstimate current() const;

    // Raw histogram over the buffered window.
    TempoHistogram histogram() const;

    void reset();

    std::size_t frames() const {
        return frames_seen_;
    }

    std::size_t buffer_frames() const {
        return buffer_frames_;
    }

private:
    double smooth_next(float value);

    TempoConfig config_;
    bool valid_ = false;
    IntervalRange range_;
    std::size_t buffer_frames_ = 0;
    std::size_t frames_seen_ = 0;

    // Trailing smoothing window.
    std::vector<double> smooth_kernel_;
    std::vector<double> smooth_history_;
    std::size_t smooth_pos_ = 0;

    // Comb: per-frame winning intervals, oldest overwritten first.
    std::unique_ptr<detail::CombFilterBank> comb_;
    struct Contribution {
        std::vector<std::size_t> intervals;
        double value = 0.0;
    };
    std::vector<Contribution> contributions_;
    std::vector<double> comb_outputs_;

    // Autocorrelation: the last `buffer_frames_` smoothed frames.
    std::vector<double> signal_ring_;

    // Write position shared by both rings.
    std::size_t ring_pos_ = 0;
};

} // namespace tempoit
