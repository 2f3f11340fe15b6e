//
//  estimate_store.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate.h"

#include <atomic>
#include <cstddef>
#include <map>
#include <set>

namespace beatconsensus {

/// @brief In-memory table of per-file, per-method tempo results.
///
/// Lifecycle: `ingest()` until every record of the run is in, then `freeze()`.
/// After freezing the store never changes, so any number of readers may query
/// it concurrently without locking. All failing calls return false and fill
/// `error` (when given) with the offending key.
class EstimateStore {
public:
    EstimateStore() = default;
    EstimateStore(const EstimateStore&) = delete;
    EstimateStore& operator=(const EstimateStore&) = delete;

    /// @brief Append one record. Rejects duplicates, non-positive or
    /// non-finite BPM values, empty keys, and any call after `freeze()`.
    bool ingest(const FileId& file_id,
                const MethodName& method,
                const BpmValue& bpm,
                ValidationError* error = nullptr);

    bool ingest(const TempoEstimate& estimate, ValidationError* error = nullptr) {
        return ingest(estimate.file_id, estimate.method, estimate.bpm, error);
    }

    /// @brief Transition to read-only. Fails on an empty corpus; freezing an
    /// already frozen store is a no-op.
    bool freeze(ValidationError* error = nullptr);

    bool is_frozen() const;

    bool estimates_for_file(const FileId& file_id,
                            MethodEstimates* out,
                            ValidationError* error = nullptr) const;

    bool estimates_for_method(const MethodName& method,
                              FileEstimates* out,
                              ValidationError* error = nullptr) const;

    std::set<MethodName> all_methods() const;
    std::set<FileId> all_files() const;

    std::size_t file_count() const { return by_file_.size(); }
    std::size_t method_count() const { return by_method_.size(); }
    std::size_t record_count() const { return record_count_; }

    // Direct read access for the analysis passes. Callers must hold a frozen store.
    const std::map<FileId, MethodEstimates>& file_table() const { return by_file_; }
    const std::map<MethodName, FileEstimates>& method_table() const { return by_method_; }

private:
    std::map<FileId, MethodEstimates> by_file_;
    std::map<MethodName, FileEstimates> by_method_;
    std::size_t record_count_ = 0;
    std::atomic<bool> frozen_{false};
};

} // namespace beatconsensus
