//
//  report.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/agreement.h"
#include "beatconsensus/config.h"
#include "beatconsensus/estimate_store.h"
#include "beatconsensus/method_stats.h"
#include "beatconsensus/variance.h"

#include <cstddef>
#include <string>
#include <vector>

namespace beatconsensus {

/// @brief Everything the summary artifact shows, computed once from a frozen store.
struct ConsensusReport {
    std::size_t total_files = 0;
    std::vector<MethodName> methods;
    std::vector<MethodStats> method_stats;
    std::vector<VarianceRecord> high_variance;
    std::vector<PairAgreement> agreements;
    double variance_threshold_bpm = 0.0;
    double agreement_tolerance_bpm = 0.0;
};

/// @brief Run aggregation, variance flagging and the agreement matrix.
///
/// The store must be frozen; otherwise returns false with `NotFrozen`.
bool build_consensus_report(const EstimateStore& store,
                            const ConsensusConfig& config,
                            ConsensusReport* out,
                            ValidationError* error = nullptr);

// Full textual summary. Identical reports render to identical bytes.
std::string format_summary_report(const ConsensusReport& report);

// Short console digest: corpus size, methods and the `top_n` widest spreads.
std::string format_console_summary(const ConsensusReport& report, std::size_t top_n);

} // namespace beatconsensus
