//
//  version.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace beatconsensus {

/// @brief Return the BeatConsensus version display string.
///
/// Mirrors CLI version output (for example: `v0.3.0`).
std::string version_string();

} // namespace beatconsensus
