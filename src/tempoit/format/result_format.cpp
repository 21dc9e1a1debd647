//
//  result_format.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/format.h"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace tempoit {

MirexTempoPair make_mirex_pair(const TempoEstimate& estimate) {
    MirexTempoPair pair;
    if (estimate.tempi.empty()) {
        return pair;
    }

    double first_bpm = estimate.tempi[0].bpm;
    double second_bpm = 0.0;
    double first_strength = 1.0;
    if (estimate.tempi.size() == 1) {
        // Synthesized partner: half tempo, no weight of its own.
        second_bpm = first_bpm * 0.5;
    } else {
        second_bpm = estimate.tempi[1].bpm;
        const double sum = estimate.tempi[0].strength + estimate.tempi[1].strength;
        first_strength = (sum > 0.0) ? estimate.tempi[0].strength / sum : 0.5;
    }

    if (first_bpm <= second_bpm) {
        pair.slower_bpm = first_bpm;
        pair.faster_bpm = second_bpm;
        pair.slower_strength = first_strength;
    } else {
        pair.slower_bpm = second_bpm;
        pair.faster_bpm = first_bpm;
        pair.slower_strength = 1.0 - first_strength;
    }
    return pair;
}

void write_tempo(std::ostream& out, const TempoEstimate& estimate, OutputFormat format) {
    const auto flags = out.flags();
    const auto precision = out.precision();

    switch (format) {
        case OutputFormat::Normal: {
            std::vector<TempoCandidate> ranked = estimate.tempi;
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const TempoCandidate& a, const TempoCandidate& b) {
                                 return a.strength > b.strength;
                             });
            out << std::fixed << std::setprecision(2);
            for (const auto& tempo : ranked) {
                out << tempo.bpm << " " << tempo.strength << "\n";
            }
            break;
        }
        case OutputFormat::Mirex: {
            const MirexTempoPair pair = make_mirex_pair(estimate);
            out << std::fixed << std::setprecision(2) << pair.slower_bpm << " "
                << pair.faster_bpm << " " << pair.slower_strength << "\n";
            break;
        }
        case OutputFormat::Raw:
            out << std::defaultfloat << std::setprecision(17);
            for (const auto& tempo : estimate.tempi) {
                out << tempo.bpm << " " << tempo.strength << "\n";
            }
            break;
    }

    out.flags(flags);
    out.precision(precision);
}

std::string format_tempo(const TempoEstimate& estimate, OutputFormat format) {
    std::ostringstream out;
    write_tempo(out, estimate, format);
    return out.str();
}

} // namespace tempoit
