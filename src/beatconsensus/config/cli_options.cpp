//
//  cli_options.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/cli_options.h"

#include "beatconsensus/preset.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace beatconsensus {

bool parse_bpm_option(const char* text, double* value) {
    if (!text || !value) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(parsed) || parsed < 0.0) {
        return false;
    }
    *value = parsed;
    return true;
}

bool parse_count_option(const char* text, std::size_t* value) {
    // strtoull accepts leading blanks and a sign; a count must start with a digit.
    if (!text || !value || !std::isdigit(static_cast<unsigned char>(*text))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        return false;
    }
    *value = static_cast<std::size_t>(parsed);
    return true;
}

bool resolve_consensus_config(const ConfigOverrides& overrides,
                              ConsensusConfig* config,
                              std::string* error) {
    if (!config) {
        if (error) {
            *error = "no config to resolve into";
        }
        return false;
    }
    ConsensusConfig resolved = *config;
    if (!overrides.preset.empty()) {
        const auto preset = make_consensus_preset(overrides.preset);
        if (!preset) {
            if (error) {
                *error = "unknown preset '" + overrides.preset + "'";
            }
            return false;
        }
        preset->apply(resolved);
    }
    if (overrides.agreement_tolerance_bpm) {
        resolved.agreement_tolerance_bpm = *overrides.agreement_tolerance_bpm;
    }
    if (overrides.variance_threshold_bpm) {
        resolved.variance_threshold_bpm = *overrides.variance_threshold_bpm;
    }
    if (overrides.console_top_variance) {
        resolved.console_top_variance = *overrides.console_top_variance;
    }
    *config = resolved;
    return true;
}

} // namespace beatconsensus
