//
//  preset.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/preset.h"

#include <algorithm>
#include <cctype>

namespace tempoit {
namespace {

class CombPreset : public TempoPreset {
public:
    const char* name() const override {
        return "comb";
    }

    void apply(TempoConfig& config) const override {
        config.method = TempoConfig::Method::CombFilter;
        config.min_bpm = 40.0f;
        config.max_bpm = 250.0f;
        config.act_smooth = 0.14;
        config.hist_smooth = 9;
        config.hist_buffer = 10.0;
        config.alpha = 0.79f;
        config.frame_rate = 100.0;
    }
};

class AutocorrelationPreset : public TempoPreset {
public:
    const char* name() const override {
        return "acf";
    }

    void apply(TempoConfig& config) const override {
        config.method = TempoConfig::Method::Autocorrelation;
        config.min_bpm = 40.0f;
        config.max_bpm = 250.0f;
        config.act_smooth = 0.14;
        // The autocorrelation peaks are already broad.
        config.hist_smooth = 5;
        config.hist_buffer = 10.0;
        config.frame_rate = 100.0;
    }
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<TempoPreset> make_tempo_preset(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "comb") {
        return std::make_unique<CombPreset>();
    }
    if (key == "acf") {
        return std::make_unique<AutocorrelationPreset>();
    }
    return nullptr;
}

std::vector<std::string> tempo_preset_names() {
    return {"comb", "acf"};
}

} // namespace tempoit
