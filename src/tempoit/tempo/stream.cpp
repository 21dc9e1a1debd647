//
//  stream.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/stream.h"

#include "comb_filter.h"
#include "smoothing.h"

#include "tempoit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace tempoit {

TempoStream::TempoStream(const TempoConfig& config)
    : config_(config) {
    std::string error;
    valid_ = validate_config(config_, &error);
    if (!valid_) {
        TEMPOIT_LOG_ERROR("Tempo stream: " << error);
        return;
    }

    range_ = candidate_interval_range(config_.frame_rate, config_.min_bpm, config_.max_bpm);
    buffer_frames_ = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::lround(config_.hist_buffer * config_.frame_rate)));
    smooth_kernel_ =
        detail::hamming_kernel(detail::smoothing_frames(config_.act_smooth, config_.frame_rate));

    if (config_.method == TempoConfig::Method::CombFilter) {
        comb_ = std::make_unique<detail::CombFilterBank>(
            config_.alpha, range_.min_interval, range_.max_interval);
    }
    reset();

    TEMPOIT_LOG_DEBUG("Tempo stream: method=" << method_name(config_.method)
                      << " buffer_frames=" << buffer_frames_
                      << " intervals=" << range_.min_interval << "-" << range_.max_interval);
}

TempoStream::~TempoStream() = default;

void TempoStream::reset() {
    frames_seen_ = 0;
    ring_pos_ = 0;
    smooth_pos_ = 0;
    smooth_history_.assign(smooth_kernel_.size(), 0.0);
    if (!valid_) {
        return;
    }
    if (comb_) {
        comb_->reset();
        contributions_.assign(buffer_frames_, Contribution{});
        signal_ring_.clear();
    } else {
        contributions_.clear();
        signal_ring_.assign(buffer_frames_, 0.0);
    }
}

double TempoStream::smooth_next(float value) {
    const std::size_t width = smooth_kernel_.size();
    smooth_history_[smooth_pos_] = static_cast<double>(value);
    // The newest frame meets the last kernel tap.
    double sum = 0.0;
    for (std::size_t m = 0; m < width; ++m) {
        const std::size_t age = width - 1 - m;
        const std::size_t index = (smooth_pos_ + width - age) % width;
        sum += smooth_history_[index] * smooth_kernel_[m];
    }
    smooth_pos_ = (smooth_pos_ + 1) % width;
    return sum;
}

void TempoStream::push(float value) {
    if (!valid_) {
        return;
    }
    if (!std::isfinite(value) || value < 0.0f) {
        TEMPOIT_LOG_WARN("Tempo stream: replacing invalid activation value at frame "
                         << frames_seen_ << " with 0.");
        value = 0.0f;
    }

    const double smoothed = smooth_next(value);
    if (comb_) {
        comb_->process(smoothed, comb_outputs_);
        Contribution& slot = contributions_[ring_pos_];
        slot.intervals.clear();
        slot.value = 0.0;
        const double peak = *std::max_element(comb_outputs_.begin(), comb_outputs_.end());
        if (peak > 0.0) {
            slot.value = peak;
            for (std::size_t k = 0; k < comb_outputs_.size(); ++k) {
                if (comb_outputs_[k] == peak) {
                    slot.intervals.push_back(comb_->min_interval() + k);
                }
            }
        }
    } else {
        signal_ring_[ring_pos_] = smoothed;
    }
    ring_pos_ = (ring_pos_ + 1) % buffer_frames_;
    ++frames_seen_;
}

void TempoStream::push(const float* values, std::size_t count) {
    if (!values) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        push(values[i]);
    }
}

TempoHistogram TempoStream::histogram() const {
    if (!valid_) {
        return TempoHistogram();
    }
    if (comb_) {
        TempoHistogram histogram(range_.min_interval, range_.max_interval);
        for (const auto& slot : contributions_) {
            for (std::size_t interval : slot.intervals) {
                histogram.add(interval, slot.value);
            }
        }
        return histogram;
    }

    const std::size_t available = std::min(frames_seen_, buffer_frames_);
    const std::size_t oldest = (frames_seen_ >= buffer_frames_) ? ring_pos_ : 0;
    std::vector<double> ordered;
    ordered.reserve(available);
    for (std::size_t i = 0; i < available; ++i) {
        ordered.push_back(signal_ring_[(oldest + i) % buffer_frames_]);
    }
    return interval_histogram_acf(ordered, range_.min_interval, range_.max_interval);
}

TempoEstimate TempoStream::current() const {
    if (!valid_ || frames_seen_ == 0) {
        return fallback_estimate(config_);
    }
    const TempoHistogram smoothed = histogram().smoothed(config_.hist_smooth);
    return detect_tempo(smoothed, config_.frame_rate, config_);
}

} // namespace tempoit
