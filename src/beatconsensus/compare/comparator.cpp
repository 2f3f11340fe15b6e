//
//  comparator.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/comparator.h"

#include <cmath>

namespace beatconsensus {

namespace {

bool within(double x, double y, double tolerance_bpm) {
    return std::fabs(x - y) <= tolerance_bpm;
}

} // namespace

TempoRelation classify_tempo_relation(double a, double b, double tolerance_bpm) {
    if (!std::isfinite(a) || !std::isfinite(b) || !(tolerance_bpm >= 0.0)) {
        return TempoRelation::None;
    }
    if (within(a, b, tolerance_bpm)) {
        return TempoRelation::Same;
    }
    if (within(a, 2.0 * b, tolerance_bpm) || within(0.5 * a, b, tolerance_bpm)) {
        return TempoRelation::Half;
    }
    if (within(2.0 * a, b, tolerance_bpm) || within(a, 0.5 * b, tolerance_bpm)) {
        return TempoRelation::Double;
    }
    return TempoRelation::None;
}

bool tempos_agree(double a, double b, double tolerance_bpm) {
    return classify_tempo_relation(a, b, tolerance_bpm) != TempoRelation::None;
}

AgreementResult compare_estimates(const FileId& file_id,
                                  const BpmValue& a,
                                  const BpmValue& b,
                                  double tolerance_bpm) {
    AgreementResult result;
    result.file_id = file_id;
    result.bpm_a = a;
    result.bpm_b = b;
    if (!a || !b) {
        return result;
    }
    result.compared = true;
    result.relation = classify_tempo_relation(*a, *b, tolerance_bpm);
    result.agree = result.relation != TempoRelation::None;
    return result;
}

const char* tempo_relation_name(TempoRelation relation) {
    switch (relation) {
        case TempoRelation::None:
            return "none";
        case TempoRelation::Same:
            return "same";
        case TempoRelation::Half:
            return "half";
        case TempoRelation::Double:
            return "double";
    }
    return "none";
}

} // namespace beatconsensus
