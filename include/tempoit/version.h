//
//  version.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace tempoit {

/// @brief Return the TempoIt version display string.
///
/// Mirrors CLI version output (for example: `v0.3.0` or `v0.3.0+abcd123`).
std::string version_string();

/// @brief Version of the binary activation cache layout written by this build.
unsigned int activation_cache_version();

} // namespace tempoit
