//
//  smoothing.h
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

// Hamming window of `size` taps normalised to unit sum; size <= 1 yields {1}.
std::vector<double> hamming_kernel(std::size_t size);

// Row `size - 1` of Pascal's triangle normalised to unit sum; finite for any size.
std::vector<double> binomial_kernel(std::size_t size);

std::size_t smoothing_frames(double seconds, double fps);

} // namespace detail
} // namespace tempoit
