//
//  source.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/activation.h"

#include "tempoit/logging.hpp"

#include <utility>

namespace tempoit {

bool CachedActivationSource::load(const std::string& input,
                                  ActivationFunction* activation,
                                  std::string* error) const {
    return read_activation_cache(input, activation, error);
}

AnalyzerActivationSource::AnalyzerActivationSource(Analyzer analyzer, std::string label)
    : analyzer_(std::move(analyzer)),
      label_(std::move(label)) {}

bool AnalyzerActivationSource::load(const std::string& input,
                                    ActivationFunction* activation,
                                    std::string* error) const {
    if (!analyzer_) {
        if (error) {
            *error = "No activation analyzer configured.";
        }
        return false;
    }
    if (!activation) {
        if (error) {
            *error = "No activation output given.";
        }
        return false;
    }

    ActivationFunction produced;
    if (!analyzer_(input, &produced, error)) {
        return false;
    }
    // Analyzers are external code; hold them to the same contract as caches.
    if (!validate_activation(produced, error)) {
        return false;
    }
    TEMPOIT_LOG_DEBUG("Analyzer '" << label_ << "': " << produced.values.size()
                      << " frames at " << produced.fps << " fps for " << input);
    *activation = std::move(produced);
    return true;
}

} // namespace tempoit
