//
//  estimate_store.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/estimate_store.h"

#include "beatconsensus/logging.hpp"

#include <cmath>
#include <sstream>

namespace beatconsensus {

namespace {

bool fail(ValidationError* error,
          ValidationError::Kind kind,
          const FileId& file_id,
          const MethodName& method,
          const std::string& message) {
    if (error) {
        error->kind = kind;
        error->file_id = file_id;
        error->method = method;
        error->message = message;
    }
    return false;
}

std::string describe_key(const FileId& file_id, const MethodName& method) {
    std::ostringstream out;
    out << "file='" << file_id << "' method='" << method << "'";
    return out.str();
}

} // namespace

bool EstimateStore::ingest(const FileId& file_id,
                           const MethodName& method,
                           const BpmValue& bpm,
                           ValidationError* error) {
    if (frozen_.load(std::memory_order_acquire)) {
        return fail(error,
                    ValidationError::Kind::IngestAfterFreeze,
                    file_id,
                    method,
                    "store is frozen, rejecting " + describe_key(file_id, method));
    }
    if (file_id.empty() || method.empty()) {
        return fail(error,
                    ValidationError::Kind::EmptyKey,
                    file_id,
                    method,
                    "empty file id or method name, " + describe_key(file_id, method));
    }
    if (bpm && (!std::isfinite(*bpm) || !(*bpm > 0.0))) {
        std::ostringstream message;
        message << "bpm " << *bpm << " is not a positive tempo, "
                << describe_key(file_id, method);
        return fail(error, ValidationError::Kind::NonPositiveBpm, file_id, method, message.str());
    }

    MethodEstimates& row = by_file_[file_id];
    if (row.find(method) != row.end()) {
        return fail(error,
                    ValidationError::Kind::DuplicateEstimate,
                    file_id,
                    method,
                    "estimate already ingested for " + describe_key(file_id, method));
    }
    row.emplace(method, bpm);
    by_method_[method].emplace(file_id, bpm);
    ++record_count_;
    return true;
}

bool EstimateStore::freeze(ValidationError* error) {
    if (frozen_.load(std::memory_order_acquire)) {
        return true;
    }
    if (record_count_ == 0) {
        return fail(error, ValidationError::Kind::EmptyCorpus, {}, {}, "no estimates ingested");
    }
    frozen_.store(true, std::memory_order_release);
    BEATCONSENSUS_LOG_DEBUG("Store frozen: files=" << by_file_.size()
                            << " methods=" << by_method_.size()
                            << " records=" << record_count_);
    return true;
}

bool EstimateStore::is_frozen() const {
    return frozen_.load(std::memory_order_acquire);
}

bool EstimateStore::estimates_for_file(const FileId& file_id,
                                       MethodEstimates* out,
                                       ValidationError* error) const {
    const auto it = by_file_.find(file_id);
    if (it == by_file_.end()) {
        return fail(error,
                    ValidationError::Kind::UnknownFile,
                    file_id,
                    {},
                    "no estimates for file '" + file_id + "'");
    }
    if (out) {
        *out = it->second;
    }
    return true;
}

bool EstimateStore::estimates_for_method(const MethodName& method,
                                         FileEstimates* out,
                                         ValidationError* error) const {
    const auto it = by_method_.find(method);
    if (it == by_method_.end()) {
        return fail(error,
                    ValidationError::Kind::UnknownMethod,
                    {},
                    method,
                    "no estimates for method '" + method + "'");
    }
    if (out) {
        *out = it->second;
    }
    return true;
}

std::set<MethodName> EstimateStore::all_methods() const {
    std::set<MethodName> methods;
    for (const auto& entry : by_method_) {
        methods.insert(entry.first);
    }
    return methods;
}

std::set<FileId> EstimateStore::all_files() const {
    std::set<FileId> files;
    for (const auto& entry : by_file_) {
        files.insert(entry.first);
    }
    return files;
}

} // namespace beatconsensus
