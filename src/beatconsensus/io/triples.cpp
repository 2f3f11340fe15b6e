//
//  triples.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/io.h"

#include "beatconsensus/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace beatconsensus {

namespace {

std::string trim(const std::string& value) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    const auto begin = std::find_if(value.begin(), value.end(), not_space);
    const auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool is_absent_marker(const std::string& token) {
    const std::string key = to_lower(token);
    return key.empty() || key == "-" || key == "none" || key == "null";
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = line.find('\t', start);
        if (end == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

bool malformed(ValidationError* error, std::size_t line_number, const std::string& message) {
    if (error) {
        std::ostringstream text;
        text << "line " << line_number << ": " << message;
        error->kind = ValidationError::Kind::MalformedInput;
        error->file_id.clear();
        error->method.clear();
        error->message = text.str();
    }
    return false;
}

} // namespace

bool read_estimate_triples(std::istream& in,
                           std::vector<TempoEstimate>* out,
                           ValidationError* error) {
    std::vector<TempoEstimate> estimates;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line.front() == '#') {
            continue;
        }

        const std::vector<std::string> fields = split_tabs(line);
        if (fields.size() != 3) {
            std::ostringstream message;
            message << "expected 3 tab separated fields, got " << fields.size();
            return malformed(error, line_number, message.str());
        }

        TempoEstimate estimate;
        // Keys are opaque: only the bpm column is trimmed.
        estimate.file_id = fields[0];
        estimate.method = fields[1];
        const std::string bpm_text = trim(fields[2]);
        if (!is_absent_marker(bpm_text)) {
            const char* begin = bpm_text.c_str();
            char* end = nullptr;
            const double bpm = std::strtod(begin, &end);
            if (end == begin || *end != '\0') {
                return malformed(error, line_number, "bpm '" + bpm_text + "' is not a number");
            }
            estimate.bpm = bpm;
        }
        estimates.push_back(std::move(estimate));
    }

    BEATCONSENSUS_LOG_DEBUG("Read " << estimates.size() << " estimates from "
                            << line_number << " lines");
    if (out) {
        *out = std::move(estimates);
    }
    return true;
}

bool ingest_and_freeze(EstimateStore& store,
                       const std::vector<TempoEstimate>& estimates,
                       ValidationError* error) {
    for (const auto& estimate : estimates) {
        if (!store.ingest(estimate, error)) {
            return false;
        }
    }
    return store.freeze(error);
}

} // namespace beatconsensus
