//
//  variance_test.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-16.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/variance.h"

#include "corpus_test_utils.h"

#include <iostream>
#include <vector>

namespace {

using beatconsensus::BpmValue;
using beatconsensus::EstimateStore;

bool test_spread_over_present_values() {
    const auto record = beatconsensus::build_variance_record(
        "reel.mp3",
        {{"essentia", 120.0}, {"librosa_onset", 125.0}, {"librosa_standard", 118.0},
         {"librosa_tempogram", BpmValue{}}});
    if (!record || record->spread != 7.0 || record->bpm_by_method.size() != 3) {
        std::cerr << "Variance test failed: expected spread 7.0 over three present values.\n";
        return false;
    }
    if (record->bpm_by_method.count("librosa_tempogram") != 0) {
        std::cerr << "Variance test failed: absent method leaked into the record.\n";
        return false;
    }
    return true;
}

bool test_single_value_produces_no_record() {
    const auto single = beatconsensus::build_variance_record(
        "jig.mp3", {{"essentia", 116.0}, {"librosa_onset", BpmValue{}}});
    if (single) {
        std::cerr << "Variance test failed: one present value must not yield a spread.\n";
        return false;
    }
    return true;
}

bool test_flagging_order_and_threshold() {
    EstimateStore store;
    if (!beatconsensus::test::build_frozen_store(store,
                                                 {
                                                     {"c.mp3", "m1", 80.0},
                                                     {"c.mp3", "m2", 120.0},
                                                     {"a.mp3", "m1", 100.0},
                                                     {"a.mp3", "m2", 140.0},
                                                     {"b.mp3", "m1", 60.0},
                                                     {"b.mp3", "m2", 180.0},
                                                     {"d.mp3", "m1", 100.0},
                                                     {"d.mp3", "m2", 120.0},
                                                     {"e.mp3", "m1", 90.0},
                                                     {"e.mp3", "m2", BpmValue{}},
                                                 },
                                                 "Variance test")) {
        return false;
    }

    const auto flagged = beatconsensus::flag_high_variance(store, 20.0);
    // d.mp3 sits exactly on the threshold and is not flagged.
    if (flagged.size() != 3) {
        std::cerr << "Variance test failed: expected 3 flagged files, got " << flagged.size()
                  << ".\n";
        return false;
    }
    if (flagged[0].file_id != "b.mp3" || flagged[1].file_id != "a.mp3" ||
        flagged[2].file_id != "c.mp3") {
        std::cerr << "Variance test failed: flagged files not ordered by spread then id.\n";
        return false;
    }

    const auto spreads = beatconsensus::compute_file_spreads(store);
    if (spreads.size() != 4 || spreads.back().file_id != "d.mp3") {
        std::cerr << "Variance test failed: spread listing should hold every comparable file.\n";
        return false;
    }
    return true;
}

bool test_two_file_scenario() {
    EstimateStore store;
    if (!beatconsensus::test::build_frozen_store(
            store, beatconsensus::test::two_file_corpus(), "Variance test")) {
        return false;
    }
    const auto flagged = beatconsensus::flag_high_variance(store, 20.0);
    if (flagged.size() != 1 || flagged[0].file_id != "B.mp3" || flagged[0].spread != 70.0) {
        std::cerr << "Variance test failed: only B.mp3 should be flagged with spread 70.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_spread_over_present_values()) {
        return 1;
    }
    if (!test_single_value_produces_no_record()) {
        return 1;
    }
    if (!test_flagging_order_and_threshold()) {
        return 1;
    }
    if (!test_two_file_scenario()) {
        return 1;
    }

    std::cout << "Variance test passed.\n";
    return 0;
}
