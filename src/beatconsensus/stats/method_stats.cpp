//
//  method_stats.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/method_stats.h"

#include "beatconsensus/logging.hpp"

#include <algorithm>

namespace beatconsensus {

double MethodStats::coverage() const {
    if (total_files == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return static_cast<double>(count) / static_cast<double>(total_files);
}

MethodStats compute_single_method_stats(const MethodName& method,
                                        const FileEstimates& estimates,
                                        std::size_t total_files) {
    MethodStats stats;
    stats.method = method;
    stats.total_files = total_files;

    double sum = 0.0;
    double min_bpm = std::numeric_limits<double>::infinity();
    double max_bpm = -std::numeric_limits<double>::infinity();
    for (const auto& cell : estimates) {
        if (!cell.second) {
            continue;
        }
        const double bpm = *cell.second;
        sum += bpm;
        min_bpm = std::min(min_bpm, bpm);
        max_bpm = std::max(max_bpm, bpm);
        ++stats.count;
    }

    if (stats.count == 0) {
        return stats;
    }
    stats.mean_bpm = sum / static_cast<double>(stats.count);
    stats.min_bpm = min_bpm;
    stats.max_bpm = max_bpm;
    return stats;
}

std::vector<MethodStats> compute_method_stats(const EstimateStore& store) {
    if (!store.is_frozen()) {
        BEATCONSENSUS_LOG_ERROR("Method stats: estimate store is not frozen");
        return {};
    }
    std::vector<MethodStats> out;
    const std::size_t total_files = store.file_count();
    out.reserve(store.method_count());
    for (const auto& entry : store.method_table()) {
        out.push_back(compute_single_method_stats(entry.first, entry.second, total_files));
        const MethodStats& stats = out.back();
        if (!stats.has_data()) {
            BEATCONSENSUS_LOG_WARN("Method '" << stats.method
                                   << "' produced no tempo for any of "
                                   << total_files << " files");
            continue;
        }
        BEATCONSENSUS_LOG_DEBUG("Method stats: method=" << stats.method
                                << " count=" << stats.count << "/" << stats.total_files
                                << " mean=" << stats.mean_bpm
                                << " min=" << stats.min_bpm
                                << " max=" << stats.max_bpm);
    }
    return out;
}

} // namespace beatconsensus
