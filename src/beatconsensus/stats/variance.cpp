//
//  variance.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/variance.h"

#include "beatconsensus/logging.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace beatconsensus {

namespace {

bool spread_order(const VarianceRecord& a, const VarianceRecord& b) {
    if (a.spread != b.spread) {
        return a.spread > b.spread;
    }
    return a.file_id < b.file_id;
}

} // namespace

std::optional<VarianceRecord> build_variance_record(const FileId& file_id,
                                                    const MethodEstimates& row) {
    VarianceRecord record;
    record.file_id = file_id;
    double min_bpm = std::numeric_limits<double>::infinity();
    double max_bpm = -std::numeric_limits<double>::infinity();
    for (const auto& cell : row) {
        if (!cell.second) {
            continue;
        }
        const double bpm = *cell.second;
        record.bpm_by_method.emplace(cell.first, bpm);
        min_bpm = std::min(min_bpm, bpm);
        max_bpm = std::max(max_bpm, bpm);
    }
    if (record.bpm_by_method.size() < 2) {
        return std::nullopt;
    }
    record.spread = max_bpm - min_bpm;
    return record;
}

std::vector<VarianceRecord> compute_file_spreads(const EstimateStore& store) {
    if (!store.is_frozen()) {
        BEATCONSENSUS_LOG_ERROR("Spread: estimate store is not frozen");
        return {};
    }
    std::vector<VarianceRecord> out;
    out.reserve(store.file_count());
    for (const auto& entry : store.file_table()) {
        auto record = build_variance_record(entry.first, entry.second);
        if (!record) {
            BEATCONSENSUS_LOG_DEBUG("Spread: file=" << entry.first
                                    << " skipped, fewer than two present values");
            continue;
        }
        out.push_back(std::move(*record));
    }
    std::sort(out.begin(), out.end(), spread_order);
    return out;
}

std::vector<VarianceRecord> flag_high_variance(const EstimateStore& store,
                                               double threshold_bpm) {
    std::vector<VarianceRecord> spreads = compute_file_spreads(store);
    std::vector<VarianceRecord> flagged;
    for (auto& record : spreads) {
        if (record.spread > threshold_bpm) {
            flagged.push_back(std::move(record));
        }
    }
    BEATCONSENSUS_LOG_DEBUG("Variance: flagged " << flagged.size() << " of "
                            << spreads.size() << " comparable files above "
                            << threshold_bpm << " BPM");
    return flagged;
}

} // namespace beatconsensus
