//
//  triples_io_test.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-17.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/io.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

using beatconsensus::TempoEstimate;
using beatconsensus::ValidationError;

bool test_parses_values_and_absent_markers() {
    std::istringstream in(
        "# file\tmethod\tbpm\n"
        "\n"
        "a.mp3\tessentia\t120.5\n"
        "a.mp3\tlibrosa_onset\t-\n"
        "b.mp3\tessentia\tNone\r\n"
        "b.mp3\tlibrosa_onset\t\n"
        "c d.mp3\tessentia\t 99 \n");
    std::vector<TempoEstimate> estimates;
    ValidationError error;
    if (!beatconsensus::read_estimate_triples(in, &estimates, &error)) {
        std::cerr << "Triples IO test failed: " << describe_validation_error(error) << "\n";
        return false;
    }
    if (estimates.size() != 5) {
        std::cerr << "Triples IO test failed: expected 5 estimates, got " << estimates.size()
                  << ".\n";
        return false;
    }
    if (!estimates[0].bpm || *estimates[0].bpm != 120.5 || estimates[1].bpm ||
        estimates[2].bpm || estimates[3].bpm) {
        std::cerr << "Triples IO test failed: bpm column misread.\n";
        return false;
    }
    if (estimates[4].file_id != "c d.mp3" || !estimates[4].bpm || *estimates[4].bpm != 99.0) {
        std::cerr << "Triples IO test failed: file ids with spaces must survive.\n";
        return false;
    }
    return true;
}

bool test_keys_are_not_trimmed() {
    std::istringstream in(
        "a.mp3\tessentia\t120\n"
        "a.mp3 \tessentia\t60\n"
        "a.mp3\t essentia\t121\n");
    std::vector<TempoEstimate> estimates;
    ValidationError error;
    if (!beatconsensus::read_estimate_triples(in, &estimates, &error) || estimates.size() != 3) {
        std::cerr << "Triples IO test failed: padded keys should parse.\n";
        return false;
    }
    if (estimates[1].file_id != "a.mp3 " || estimates[2].method != " essentia") {
        std::cerr << "Triples IO test failed: key whitespace was altered.\n";
        return false;
    }

    // Distinct raw keys must not collapse into a duplicate.
    beatconsensus::EstimateStore store;
    if (!beatconsensus::ingest_and_freeze(store, estimates, &error)) {
        std::cerr << "Triples IO test failed: " << describe_validation_error(error) << "\n";
        return false;
    }
    if (store.file_count() != 2 || store.method_count() != 2 || store.record_count() != 3) {
        std::cerr << "Triples IO test failed: padded keys merged in the store.\n";
        return false;
    }
    return true;
}

bool test_rejects_malformed_lines() {
    const char* bad_inputs[] = {
        "a.mp3\tessentia\n",
        "a.mp3\tessentia\t120\textra\n",
        "a.mp3\tessentia\tfast\n",
        "a.mp3\tessentia\t120bpm\n",
    };
    for (const char* text : bad_inputs) {
        std::istringstream in(std::string("# header\n") + text);
        std::vector<TempoEstimate> estimates;
        ValidationError error;
        if (beatconsensus::read_estimate_triples(in, &estimates, &error)) {
            std::cerr << "Triples IO test failed: accepted malformed line: " << text;
            return false;
        }
        if (error.kind != ValidationError::Kind::MalformedInput ||
            error.message.find("line 2") == std::string::npos) {
            std::cerr << "Triples IO test failed: error should name line 2, got: "
                      << error.message << "\n";
            return false;
        }
    }
    return true;
}

bool test_ingest_stops_on_bad_record() {
    std::istringstream in(
        "a.mp3\tessentia\t120\n"
        "a.mp3\tessentia\t0\n");
    std::vector<TempoEstimate> estimates;
    if (!beatconsensus::read_estimate_triples(in, &estimates)) {
        std::cerr << "Triples IO test failed: range checks belong to the store.\n";
        return false;
    }
    beatconsensus::EstimateStore store;
    ValidationError error;
    if (beatconsensus::ingest_and_freeze(store, estimates, &error) ||
        error.kind != ValidationError::Kind::NonPositiveBpm || store.is_frozen()) {
        std::cerr << "Triples IO test failed: zero bpm should abort ingestion.\n";
        return false;
    }
    return true;
}

bool test_write_text_file() {
    const std::string path = "beatconsensus_triples_io_test_output.txt";
    const std::string text = "Total files analyzed: 1\n";
    std::string error;
    if (!beatconsensus::write_text_file(path, text, &error)) {
        std::cerr << "Triples IO test failed: " << error << "\n";
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    const std::string read_back((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
    in.close();
    std::remove(path.c_str());
    if (read_back != text) {
        std::cerr << "Triples IO test failed: written file content mismatch.\n";
        return false;
    }
    if (beatconsensus::write_text_file("", text, &error) || error.empty()) {
        std::cerr << "Triples IO test failed: empty path accepted.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_parses_values_and_absent_markers()) {
        return 1;
    }
    if (!test_keys_are_not_trimmed()) {
        return 1;
    }
    if (!test_rejects_malformed_lines()) {
        return 1;
    }
    if (!test_ingest_stops_on_bad_record()) {
        return 1;
    }
    if (!test_write_text_file()) {
        return 1;
    }

    std::cout << "Triples IO test passed.\n";
    return 0;
}
