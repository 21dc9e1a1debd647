//
//  version.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tempoit/version.h"
#include "tempoit_version.hpp"

namespace tempoit {

std::string version_string() {
    return TEMPOIT_VERSION_DISPLAY;
}

unsigned int activation_cache_version() {
    return TEMPOIT_ACTIVATION_CACHE_VERSION;
}

} // namespace tempoit
