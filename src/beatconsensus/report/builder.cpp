//
//  builder.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/report.h"

#include "beatconsensus/logging.hpp"

#include <chrono>
#include <utility>

namespace beatconsensus {

bool build_consensus_report(const EstimateStore& store,
                            const ConsensusConfig& config,
                            ConsensusReport* out,
                            ValidationError* error) {
    if (!store.is_frozen()) {
        if (error) {
            error->kind = ValidationError::Kind::NotFrozen;
            error->file_id.clear();
            error->method.clear();
            error->message = "analysis requires a frozen estimate store";
        }
        return false;
    }
    if (!out) {
        return true;
    }

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();

    ConsensusReport report;
    report.total_files = store.file_count();
    for (const auto& entry : store.method_table()) {
        report.methods.push_back(entry.first);
    }
    report.variance_threshold_bpm = config.variance_threshold_bpm;
    report.agreement_tolerance_bpm = config.agreement_tolerance_bpm;

    report.method_stats = compute_method_stats(store);
    const auto stats_done = Clock::now();
    report.high_variance = flag_high_variance(store, config.variance_threshold_bpm);
    const auto variance_done = Clock::now();
    report.agreements = compute_agreement_matrix(store, config.agreement_tolerance_bpm);
    const auto agreement_done = Clock::now();

    auto to_ms = [](Clock::duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    };
    BEATCONSENSUS_LOG_INFO("Timing(report): stats=" << to_ms(stats_done - start)
                           << "ms variance=" << to_ms(variance_done - stats_done)
                           << "ms agreement=" << to_ms(agreement_done - variance_done)
                           << "ms files=" << report.total_files
                           << " methods=" << report.methods.size());

    *out = std::move(report);
    return true;
}

} // namespace beatconsensus
