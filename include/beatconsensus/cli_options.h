//
//  cli_options.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/config.h"

#include <cstddef>
#include <optional>
#include <string>

namespace beatconsensus {

/// @brief Threshold settings as given on the command line, before resolution.
struct ConfigOverrides {
    std::string preset;
    std::optional<double> agreement_tolerance_bpm;
    std::optional<double> variance_threshold_bpm;
    std::optional<std::size_t> console_top_variance;
};

// Full-string parse of a finite, non-negative BPM value.
bool parse_bpm_option(const char* text, double* value);
// Full-string parse of a non-negative decimal count.
bool parse_count_option(const char* text, std::size_t* value);

/// @brief Applies `overrides` on top of `config`.
///
/// The named preset (if any) is applied first; explicit values then replace
/// whatever the preset set, regardless of the order they were given in.
/// An unknown preset name fails, leaves `config` untouched and fills `error`.
bool resolve_consensus_config(const ConfigOverrides& overrides,
                              ConsensusConfig* config,
                              std::string* error = nullptr);

} // namespace beatconsensus
