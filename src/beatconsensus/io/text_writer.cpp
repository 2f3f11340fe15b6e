//
//  text_writer.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/io.h"

#include <fstream>

namespace beatconsensus {

bool write_text_file(const std::string& path, const std::string& text, std::string* error) {
    if (path.empty()) {
        if (error) {
            *error = "Empty output path.";
        }
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        if (error) {
            *error = "Failed to open output file '" + path + "'.";
        }
        return false;
    }

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out.good()) {
        if (error) {
            *error = "Failed to write output file '" + path + "'.";
        }
        return false;
    }

    return true;
}

} // namespace beatconsensus
