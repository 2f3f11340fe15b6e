//
//  matrix.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/agreement.h"

#include "beatconsensus/logging.hpp"

#include <algorithm>
#include <initializer_list>
#include <tuple>

namespace beatconsensus {

namespace {

bool matrix_order(const PairAgreement& a, const PairAgreement& b) {
    if (a.defined() != b.defined()) {
        return a.defined();
    }
    if (a.defined() && a.percentage != b.percentage) {
        return a.percentage > b.percentage;
    }
    return std::tie(a.method_a, a.method_b) < std::tie(b.method_a, b.method_b);
}

} // namespace

bool compare_method_pair(const EstimateStore& store,
                         const MethodName& method_a,
                         const MethodName& method_b,
                         double tolerance_bpm,
                         std::vector<AgreementResult>* out,
                         ValidationError* error) {
    if (!store.is_frozen()) {
        if (error) {
            error->kind = ValidationError::Kind::NotFrozen;
            error->file_id.clear();
            error->method.clear();
            error->message = "estimate store must be frozen before comparing methods";
        }
        return false;
    }
    const auto& methods = store.method_table();
    for (const MethodName* method : {&method_a, &method_b}) {
        if (methods.find(*method) == methods.end()) {
            if (error) {
                error->kind = ValidationError::Kind::UnknownMethod;
                error->file_id.clear();
                error->method = *method;
                error->message = "no estimates for method '" + *method + "'";
            }
            return false;
        }
    }
    if (!out) {
        return true;
    }

    out->clear();
    for (const auto& entry : store.file_table()) {
        const MethodEstimates& row = entry.second;
        const auto a = row.find(method_a);
        const auto b = row.find(method_b);
        if (a == row.end() && b == row.end()) {
            continue;
        }
        const BpmValue bpm_a = (a != row.end()) ? a->second : BpmValue{};
        const BpmValue bpm_b = (b != row.end()) ? b->second : BpmValue{};
        out->push_back(compare_estimates(entry.first, bpm_a, bpm_b, tolerance_bpm));
    }
    return true;
}

PairAgreement summarize_pair(const MethodName& method_a,
                             const MethodName& method_b,
                             const std::vector<AgreementResult>& results) {
    PairAgreement pair;
    pair.method_a = method_a;
    pair.method_b = method_b;
    for (const auto& result : results) {
        if (!result.compared) {
            continue;
        }
        ++pair.compared;
        if (result.agree) {
            ++pair.agreeing;
        }
    }
    if (pair.compared > 0) {
        pair.percentage = (static_cast<double>(pair.agreeing) /
                           static_cast<double>(pair.compared)) * 100.0;
    }
    return pair;
}

std::vector<PairAgreement> compute_agreement_matrix(const EstimateStore& store,
                                                    double tolerance_bpm) {
    if (!store.is_frozen()) {
        BEATCONSENSUS_LOG_ERROR("Agreement: estimate store is not frozen");
        return {};
    }
    std::vector<MethodName> methods;
    for (const auto& entry : store.method_table()) {
        methods.push_back(entry.first);
    }

    std::vector<PairAgreement> matrix;
    std::vector<AgreementResult> results;
    for (std::size_t i = 0; i < methods.size(); ++i) {
        for (std::size_t j = i + 1; j < methods.size(); ++j) {
            ValidationError error;
            if (!compare_method_pair(
                    store, methods[i], methods[j], tolerance_bpm, &results, &error)) {
                BEATCONSENSUS_LOG_ERROR("Agreement: " << describe_validation_error(error));
                continue;
            }
            matrix.push_back(summarize_pair(methods[i], methods[j], results));

            auto debug_stream = BEATCONSENSUS_LOG_DEBUG_STREAM();
            debug_stream << "Agreement: " << methods[i] << " vs " << methods[j]
                         << " matched=" << matrix.back().agreeing
                         << " compared=" << matrix.back().compared;
            for (const auto& result : results) {
                if (result.compared && result.relation != TempoRelation::Same) {
                    debug_stream << "\n  " << result.file_id << ": " << *result.bpm_a
                                 << " vs " << *result.bpm_b << " ("
                                 << tempo_relation_name(result.relation) << ")";
                }
            }
        }
    }

    std::sort(matrix.begin(), matrix.end(), matrix_order);
    return matrix;
}

} // namespace beatconsensus
