//
//  corpus_test_utils.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-16.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate_store.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace beatconsensus::test {

inline bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

// Ingests all estimates and freezes; reports the first rejection to stderr.
inline bool build_frozen_store(EstimateStore& store,
                               const std::vector<TempoEstimate>& estimates,
                               const char* test_name) {
    for (const auto& estimate : estimates) {
        ValidationError error;
        if (!store.ingest(estimate, &error)) {
            std::cerr << test_name << ": unexpected ingest failure: "
                      << describe_validation_error(error) << "\n";
            return false;
        }
    }
    ValidationError error;
    if (!store.freeze(&error)) {
        std::cerr << test_name << ": unexpected freeze failure: "
                  << describe_validation_error(error) << "\n";
        return false;
    }
    return true;
}

// Two files, two methods: an agreeing pair and a double-time pair.
inline std::vector<TempoEstimate> two_file_corpus() {
    return {
        {"A.mp3", "method1", 100.0},
        {"A.mp3", "method2", 102.0},
        {"B.mp3", "method1", 70.0},
        {"B.mp3", "method2", 140.0},
    };
}

} // namespace beatconsensus::test
