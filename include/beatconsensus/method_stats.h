//
//  method_stats.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate_store.h"

#include <cstddef>
#include <limits>
#include <vector>

namespace beatconsensus {

struct MethodStats {
    MethodName method;
    // Files where the method produced a value.
    std::size_t count = 0;
    // Corpus size; the coverage denominator.
    std::size_t total_files = 0;
    // NaN when count == 0.
    double mean_bpm = std::numeric_limits<double>::quiet_NaN();
    double min_bpm = std::numeric_limits<double>::quiet_NaN();
    double max_bpm = std::numeric_limits<double>::quiet_NaN();

    bool has_data() const { return count > 0; }
    double coverage() const;
};

MethodStats compute_single_method_stats(const MethodName& method,
                                        const FileEstimates& estimates,
                                        std::size_t total_files);

// One entry per method in the store, ordered by method name.
// Empty (with an error log) when the store has not been frozen.
std::vector<MethodStats> compute_method_stats(const EstimateStore& store);

} // namespace beatconsensus
