//
//  variance.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate_store.h"

#include <map>
#include <optional>
#include <vector>

namespace beatconsensus {

inline constexpr double kDefaultVarianceThresholdBpm = 20.0;

struct VarianceRecord {
    FileId file_id;
    // Present values only; methods without a result for the file are missing.
    std::map<MethodName, double> bpm_by_method;
    double spread = 0.0;
};

// Empty for rows with fewer than two present values.
std::optional<VarianceRecord> build_variance_record(const FileId& file_id,
                                                    const MethodEstimates& row);

// Every file with at least two present values, spread descending then file id.
// The store must be frozen; an unfrozen store yields nothing and logs an error.
std::vector<VarianceRecord> compute_file_spreads(const EstimateStore& store);

// Files whose spread exceeds `threshold_bpm` (strictly). Same ordering and
// frozen-store requirement as compute_file_spreads.
std::vector<VarianceRecord> flag_high_variance(
    const EstimateStore& store,
    double threshold_bpm = kDefaultVarianceThresholdBpm);

} // namespace beatconsensus
