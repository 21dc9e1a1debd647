//
//  format.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "tempoit/config.h"
#include "tempoit/tempo.h"

#include <iosfwd>
#include <string>

namespace tempoit {

/// @brief Slower/faster tempo pair as reported by the MIREX convention.
struct MirexTempoPair {
    double slower_bpm = 0.0;
    double faster_bpm = 0.0;
    // Strength of the slower tempo relative to the pair.
    double slower_strength = 0.0;
};

/// @brief Build the MIREX pair from the two strongest tempi.
///
/// A single estimate gets a synthesized second tempo at half its value,
/// with the primary tempo keeping the full relative strength. An empty
/// estimate yields an all-zero pair. `slower_bpm <= faster_bpm` always holds.
MirexTempoPair make_mirex_pair(const TempoEstimate& estimate);

/// @brief Encode tempi.
///
/// - `Normal`: one `<bpm> <strength>` line per tempo, strongest first.
/// - `Mirex`: one `<slower> <faster> <slower_strength>` line.
/// - `Raw`: one `<bpm> <strength>` line per tempo in estimator order,
///   full precision.
void write_tempo(std::ostream& out, const TempoEstimate& estimate, OutputFormat format);

std::string format_tempo(const TempoEstimate& estimate, OutputFormat format);

} // namespace tempoit
