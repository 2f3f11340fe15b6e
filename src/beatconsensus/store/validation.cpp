//
//  validation.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/estimate.h"

namespace beatconsensus {

const char* validation_error_kind_name(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::None:
            return "none";
        case ValidationError::Kind::DuplicateEstimate:
            return "duplicate estimate";
        case ValidationError::Kind::NonPositiveBpm:
            return "non-positive bpm";
        case ValidationError::Kind::IngestAfterFreeze:
            return "ingest after freeze";
        case ValidationError::Kind::EmptyCorpus:
            return "empty corpus";
        case ValidationError::Kind::EmptyKey:
            return "empty key";
        case ValidationError::Kind::UnknownMethod:
            return "unknown method";
        case ValidationError::Kind::UnknownFile:
            return "unknown file";
        case ValidationError::Kind::NotFrozen:
            return "store not frozen";
        case ValidationError::Kind::MalformedInput:
            return "malformed input";
    }
    return "unknown";
}

std::string describe_validation_error(const ValidationError& error) {
    std::string out = validation_error_kind_name(error.kind);
    if (!error.message.empty()) {
        out += ": ";
        out += error.message;
    }
    return out;
}

} // namespace beatconsensus
