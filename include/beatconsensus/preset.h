//
//  preset.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/config.h"

#include <memory>
#include <string>
#include <vector>

namespace beatconsensus {

class ConsensusPreset {
public:
    virtual ~ConsensusPreset() = default;
    virtual const char* name() const = 0;
    virtual void apply(ConsensusConfig& config) const = 0;
};

// Returns nullptr for unknown names. Lookup is case-insensitive.
std::unique_ptr<ConsensusPreset> make_consensus_preset(const std::string& name);
std::vector<std::string> consensus_preset_names();

} // namespace beatconsensus
