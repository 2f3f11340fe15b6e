//
//  version.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/version.h"
#include "beatconsensus_version.hpp"

namespace beatconsensus {

std::string version_string() {
    return BEATCONSENSUS_VERSION_DISPLAY;
}

} // namespace beatconsensus
