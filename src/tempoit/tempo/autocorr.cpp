//
//  autocorr.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/histogram.h"
#include "tempoit/logging.hpp"
#include "tempoit/tempo.h"

#include <algorithm>

namespace tempoit {

TempoHistogram interval_histogram_acf(const std::vector<double>& signal,
                                      std::size_t min_interval,
                                      std::size_t max_interval,
                                      const CancelCheck& cancel) {
    min_interval = std::max<std::size_t>(1, min_interval);
    TempoHistogram histogram(min_interval, max_interval);

    double energy = 0.0;
    for (double v : signal) {
        energy += v * v;
    }
    if (energy <= 0.0) {
        return histogram;
    }

    for (std::size_t lag = histogram.min_interval(); lag <= histogram.max_interval(); ++lag) {
        if (cancel && cancel()) {
            TEMPOIT_LOG_DEBUG("ACF: cancelled at lag " << lag);
            return TempoHistogram(histogram.min_interval(), histogram.max_interval());
        }
        // Lags beyond the signal carry no evidence.
        if (lag >= signal.size()) {
            break;
        }
        double sum = 0.0;
        for (std::size_t i = 0; i + lag < signal.size(); ++i) {
            sum += signal[i] * signal[i + lag];
        }
        histogram.add(lag, sum / energy);
    }
    return histogram;
}

} // namespace tempoit
