//
//  config.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>

namespace beatconsensus {

struct ConsensusConfig {
    // Absolute tolerance (BPM) for two tempi, or one tempo and half/double of
    // the other, to count as the same tempo.
    double agreement_tolerance_bpm = 5.0;
    // A file is flagged when max - min over its present estimates exceeds this.
    double variance_threshold_bpm = 20.0;
    // Number of flagged files listed in the console digest.
    std::size_t console_top_variance = 5;
    bool verbose = false;
    bool profile = false;
};

} // namespace beatconsensus
