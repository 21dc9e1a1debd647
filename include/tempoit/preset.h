//
//  preset.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "tempoit/config.h"

#include <memory>
#include <string>
#include <vector>

namespace tempoit {

class TempoPreset {
public:
    virtual ~TempoPreset() = default;
    virtual const char* name() const = 0;
    virtual void apply(TempoConfig& config) const = 0;
};

std::unique_ptr<TempoPreset> make_tempo_preset(const std::string& name);
std::vector<std::string> tempo_preset_names();

} // namespace tempoit
