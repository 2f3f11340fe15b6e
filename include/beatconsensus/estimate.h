//
//  estimate.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <optional>
#include <string>

namespace beatconsensus {

using FileId = std::string;
using MethodName = std::string;

/// @brief A tempo slot: a detected BPM, or empty when the method failed on that file.
///
/// An empty value is a first-class result. It is never read as 0 BPM.
using BpmValue = std::optional<double>;

/// @brief One (file, method) tempo result as delivered by an estimator.
struct TempoEstimate {
    FileId file_id;
    MethodName method;
    BpmValue bpm;
};

// Ordered containers keep every derived structure deterministic.
using MethodEstimates = std::map<MethodName, BpmValue>;
using FileEstimates = std::map<FileId, BpmValue>;

/// @brief Fatal input problem for a run.
///
/// Carries the offending key so callers can point at the bad record.
struct ValidationError {
    enum class Kind {
        None,
        DuplicateEstimate,
        NonPositiveBpm,
        IngestAfterFreeze,
        EmptyCorpus,
        EmptyKey,
        UnknownMethod,
        UnknownFile,
        NotFrozen,
        MalformedInput,
    };
    Kind kind = Kind::None;
    FileId file_id;
    MethodName method;
    std::string message;
};

const char* validation_error_kind_name(ValidationError::Kind kind);

// Formats "<kind>: <message>" for log lines.
std::string describe_validation_error(const ValidationError& error);

} // namespace beatconsensus
