//
//  stages.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/format.h"
#include "tempoit/logging.hpp"
#include "tempoit/pipeline.h"

#include <ostream>

namespace tempoit {

bool ItemContext::expired() const {
    return has_deadline && std::chrono::steady_clock::now() >= deadline;
}

CancelCheck ItemContext::cancel_check() const {
    if (!has_deadline) {
        return {};
    }
    const auto limit = deadline;
    return [limit]() { return std::chrono::steady_clock::now() >= limit; };
}

bool OutputStage::validate(std::string*) const {
    return true;
}

TempoOutputStage::TempoOutputStage(const TempoConfig& config)
    : config_(config) {}

bool TempoOutputStage::validate(std::string* error) const {
    return validate_config(config_, error);
}

bool TempoOutputStage::process(const ActivationFunction& activation,
                               const ItemContext& context,
                               std::ostream& out,
                               std::string* error) const {
    TempoEstimate estimate;
    if (!estimate_tempo(activation, config_, &estimate, error, context.cancel_check())) {
        return false;
    }
    if (estimate.fallback) {
        TEMPOIT_LOG_WARN("Tempo: " << context.input << " has no usable activation.");
    }
    write_tempo(out, estimate, config_.output_format);
    if (!out) {
        if (error) {
            *error = "Failed to write tempo output.";
        }
        return false;
    }
    return true;
}

CacheWriterStage::CacheWriterStage(ActivationCacheFormat format)
    : format_(format) {}

bool CacheWriterStage::process(const ActivationFunction& activation,
                               const ItemContext&,
                               std::ostream& out,
                               std::string* error) const {
    return write_activation_cache(out, activation, format_, error);
}

} // namespace tempoit
