//
//  agreement.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/comparator.h"
#include "beatconsensus/estimate_store.h"

#include <cstddef>
#include <limits>
#include <vector>

namespace beatconsensus {

struct PairAgreement {
    // method_a < method_b.
    MethodName method_a;
    MethodName method_b;
    std::size_t agreeing = 0;
    // Files where both methods produced a value.
    std::size_t compared = 0;
    // NaN when compared == 0.
    double percentage = std::numeric_limits<double>::quiet_NaN();

    bool defined() const { return compared > 0; }
};

/// @brief Compare two methods file by file.
///
/// Every file that carries a record for either method yields one entry, in
/// file id order; entries where a side is absent have `compared == false`.
/// Fails with `NotFrozen` on an unfrozen store and with `UnknownMethod` when
/// either method is not in the store.
bool compare_method_pair(const EstimateStore& store,
                         const MethodName& method_a,
                         const MethodName& method_b,
                         double tolerance_bpm,
                         std::vector<AgreementResult>* out,
                         ValidationError* error = nullptr);

PairAgreement summarize_pair(const MethodName& method_a,
                             const MethodName& method_b,
                             const std::vector<AgreementResult>& results);

/// @brief Agreement for every unordered pair of distinct methods.
///
/// Ordered by percentage descending, ties by (method_a, method_b). Pairs
/// without any commonly covered file come last, in name order. Empty, with an
/// error log, when the store has not been frozen.
std::vector<PairAgreement> compute_agreement_matrix(
    const EstimateStore& store,
    double tolerance_bpm = kDefaultAgreementToleranceBpm);

} // namespace beatconsensus
