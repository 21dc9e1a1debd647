//
//  smoothing.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "smoothing.h"

#include "tempoit/tempo.h"

#include <algorithm>
#include <cmath>

namespace tempoit {
namespace detail {

std::vector<double> hamming_kernel(std::size_t size) {
    if (size <= 1) {
        return {1.0};
    }
    constexpr double kPi = 3.14159265358979323846;
    std::vector<double> kernel(size, 0.0);
    double sum = 0.0;
    for (std::size_t i = 0; i < size; ++i) {
        kernel[i] =
            0.54 - 0.46 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(size - 1));
        sum += kernel[i];
    }
    for (double& k : kernel) {
        k /= sum;
    }
    return kernel;
}

std::vector<double> binomial_kernel(std::size_t size) {
    if (size <= 1) {
        return {1.0};
    }
    // Each row halves the pairwise sums, so the taps stay at unit sum.
    std::vector<double> kernel(size, 0.0);
    kernel[0] = 1.0;
    for (std::size_t row = 1; row < size; ++row) {
        for (std::size_t i = row; i > 0; --i) {
            kernel[i] = 0.5 * (kernel[i] + kernel[i - 1]);
        }
        kernel[0] *= 0.5;
    }
    return kernel;
}

std::size_t smoothing_frames(double seconds, double fps) {
    if (seconds <= 0.0 || fps <= 0.0) {
        return 0;
    }
    return static_cast<std::size_t>(std::lround(seconds * fps));
}

} // namespace detail

std::vector<double> smooth_signal(const std::vector<double>& values, std::size_t window) {
    if (window <= 1 || values.empty()) {
        return values;
    }

    const std::vector<double> kernel = detail::hamming_kernel(window);
    const std::size_t n = values.size();
    const std::size_t lead = (window - 1) / 2;
    std::vector<double> out(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (std::size_t m = 0; m < window; ++m) {
            // Source index i - lead + m; zero outside the signal.
            if (i + m < lead) {
                continue;
            }
            const std::size_t j = i + m - lead;
            if (j >= n) {
                break;
            }
            sum += values[j] * kernel[m];
        }
        out[i] = sum;
    }
    return out;
}

std::vector<double> smooth_histogram(const std::vector<double>& bins, std::size_t window) {
    const std::size_t n = bins.size();
    if (window <= 1 || n < 2) {
        return bins;
    }
    if (window % 2 == 0) {
        ++window;
    }

    const std::vector<double> kernel = detail::binomial_kernel(window);
    const long lead = static_cast<long>(window - 1) / 2;
    const long period = 2 * static_cast<long>(n - 1);
    std::vector<double> out(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (std::size_t m = 0; m < window; ++m) {
            // Reflect about the first and last bucket.
            long j = (static_cast<long>(i) - lead + static_cast<long>(m)) % period;
            if (j < 0) {
                j += period;
            }
            if (j >= static_cast<long>(n)) {
                j = period - j;
            }
            sum += bins[static_cast<std::size_t>(j)] * kernel[m];
        }
        out[i] = sum;
    }
    return out;
}

std::vector<double> smooth_activation(const std::vector<float>& values, std::size_t window) {
    std::vector<double> signal(values.begin(), values.end());
    return smooth_signal(signal, window);
}

IntervalRange candidate_interval_range(double fps, double min_bpm, double max_bpm) {
    IntervalRange range;
    if (fps <= 0.0 || min_bpm <= 0.0 || max_bpm <= min_bpm) {
        return range;
    }
    constexpr double kEps = 1e-9;
    const double shortest = std::ceil((60.0 * fps) / max_bpm - kEps);
    const double longest = std::floor((60.0 * fps) / min_bpm + kEps);
    range.min_interval = static_cast<std::size_t>(std::max(1.0, shortest));
    range.max_interval = static_cast<std::size_t>(std::max(0.0, longest));
    if (range.max_interval < range.min_interval) {
        range.max_interval = range.min_interval;
    }
    return range;
}

} // namespace tempoit
