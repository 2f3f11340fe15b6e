//
//  preset.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/preset.h"

#include <algorithm>
#include <cctype>

namespace beatconsensus {
namespace {

class DefaultPreset : public ConsensusPreset {
public:
    const char* name() const override {
        return "default";
    }

    void apply(ConsensusConfig& config) const override {
        config.agreement_tolerance_bpm = 5.0;
        config.variance_threshold_bpm = 20.0;
    }
};

// Tight matching for material with a steady, clearly articulated pulse.
class StrictPreset : public ConsensusPreset {
public:
    const char* name() const override {
        return "strict";
    }

    void apply(ConsensusConfig& config) const override {
        config.agreement_tolerance_bpm = 2.0;
        config.variance_threshold_bpm = 10.0;
    }
};

// Loose matching for rubato-heavy or live recordings.
class LenientPreset : public ConsensusPreset {
public:
    const char* name() const override {
        return "lenient";
    }

    void apply(ConsensusConfig& config) const override {
        config.agreement_tolerance_bpm = 8.0;
        config.variance_threshold_bpm = 30.0;
    }
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<ConsensusPreset> make_consensus_preset(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "default") {
        return std::make_unique<DefaultPreset>();
    }
    if (key == "strict") {
        return std::make_unique<StrictPreset>();
    }
    if (key == "lenient") {
        return std::make_unique<LenientPreset>();
    }
    return nullptr;
}

std::vector<std::string> consensus_preset_names() {
    return {"default", "strict", "lenient"};
}

} // namespace beatconsensus
