//
//  comparator.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate.h"

namespace beatconsensus {

inline constexpr double kDefaultAgreementToleranceBpm = 5.0;

/// @brief Which tempo relation made two estimates agree.
enum class TempoRelation {
    None,
    // |a - b| within tolerance.
    Same,
    // b is (close to) half of a.
    Half,
    // b is (close to) double of a.
    Double,
};

/// @brief Outcome of comparing two (file, method) estimates of the same file.
///
/// `compared` is false when either side is absent; such pairs carry no
/// verdict and are left out of every agreement denominator.
struct AgreementResult {
    FileId file_id;
    BpmValue bpm_a;
    BpmValue bpm_b;
    bool compared = false;
    bool agree = false;
    TempoRelation relation = TempoRelation::None;
};

/// @brief Classify `b` relative to `a` under octave ambiguity.
///
/// Direct match wins over the octave relations. The half/double tests accept
/// either side being scaled (`|a - 2b|` and `|a/2 - b|` for Half), which keeps
/// the predicate symmetric under swapping the arguments.
TempoRelation classify_tempo_relation(double a, double b, double tolerance_bpm);

/// @brief True when `a` and `b` count as the same tempo, allowing half/double time.
///
/// Symmetric: `tempos_agree(a, b, t) == tempos_agree(b, a, t)`.
bool tempos_agree(double a,
                  double b,
                  double tolerance_bpm = kDefaultAgreementToleranceBpm);

AgreementResult compare_estimates(const FileId& file_id,
                                  const BpmValue& a,
                                  const BpmValue& b,
                                  double tolerance_bpm = kDefaultAgreementToleranceBpm);

const char* tempo_relation_name(TempoRelation relation);

} // namespace beatconsensus
