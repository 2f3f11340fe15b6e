//
//  io.h
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "beatconsensus/estimate_store.h"

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace beatconsensus {

/// @brief Parse tab separated `file_id <TAB> method <TAB> bpm` lines.
///
/// Blank lines and lines starting with `#` are skipped. A bpm column of `-`,
/// `none`, `null` or an empty string marks a failed detection. Anything else
/// must parse completely as a number; range checks are left to the store.
/// On failure `error` names the line.
bool read_estimate_triples(std::istream& in,
                           std::vector<TempoEstimate>* out,
                           ValidationError* error = nullptr);

/// @brief Ingest every estimate and freeze the store. Stops at the first rejected record.
bool ingest_and_freeze(EstimateStore& store,
                       const std::vector<TempoEstimate>& estimates,
                       ValidationError* error = nullptr);

bool write_text_file(const std::string& path, const std::string& text, std::string* error);

} // namespace beatconsensus
