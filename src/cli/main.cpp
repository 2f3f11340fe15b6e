//
//  main.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-16.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/cli_options.h"
#include "beatconsensus/config.h"
#include "beatconsensus/io.h"
#include "beatconsensus/logging.hpp"
#include "beatconsensus/preset.h"
#include "beatconsensus/report.h"
#include "beatconsensus/version.h"

#include <getopt.h>

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [estimates.tsv]\n"
              << "Reads tab separated `file <TAB> method <TAB> bpm` lines (stdin when no\n"
              << "file is given; `-` marks a failed detection) and prints a tempo\n"
              << "consensus report.\n"
              << "Options:\n"
              << "  -t, --tolerance <bpm>  Agreement tolerance (default 5)\n"
              << "  -T, --threshold <bpm>  High variance threshold (default 20)\n"
              << "  -p, --preset <name>    Apply a preset:";
    for (const auto& name : beatconsensus::consensus_preset_names()) {
        std::cerr << " " << name;
    }
    std::cerr << "\n"
              << "  -n, --top <count>      Flagged files listed in the digest (default 5)\n"
              << "  -o, --output <file>    Write the full report to a file\n"
              << "  -v, --verbose          Debug logging\n"
              << "      --profile          Timing logs\n"
              << "  -V, --version          Print version and exit\n"
              << "  -h, --help             Show this help\n";
}

} // namespace

int main(int argc, char** argv) {
    beatconsensus::ConsensusConfig config;
    beatconsensus::ConfigOverrides overrides;
    std::string output_path;
    double bpm = 0.0;
    std::size_t count = 0;

    enum { kProfileOption = 1000 };
    static struct option long_options[] = {
        {"tolerance", required_argument, nullptr, 't'},
        {"threshold", required_argument, nullptr, 'T'},
        {"preset", required_argument, nullptr, 'p'},
        {"top", required_argument, nullptr, 'n'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"profile", no_argument, nullptr, kProfileOption},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int opt = 0;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "t:T:p:n:o:vVh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 't':
                if (!beatconsensus::parse_bpm_option(optarg, &bpm)) {
                    std::cerr << "Invalid --tolerance value: " << optarg << "\n";
                    return EXIT_FAILURE;
                }
                overrides.agreement_tolerance_bpm = bpm;
                break;
            case 'T':
                if (!beatconsensus::parse_bpm_option(optarg, &bpm)) {
                    std::cerr << "Invalid --threshold value: " << optarg << "\n";
                    return EXIT_FAILURE;
                }
                overrides.variance_threshold_bpm = bpm;
                break;
            case 'p':
                overrides.preset = optarg;
                break;
            case 'n':
                if (!beatconsensus::parse_count_option(optarg, &count)) {
                    std::cerr << "Invalid --top value: " << optarg << "\n";
                    return EXIT_FAILURE;
                }
                overrides.console_top_variance = count;
                break;
            case 'o':
                output_path = optarg;
                break;
            case 'v':
                config.verbose = true;
                break;
            case kProfileOption:
                config.profile = true;
                break;
            case 'V':
                std::cout << beatconsensus::version_string() << "\n";
                return EXIT_SUCCESS;
            case 'h':
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            default:
                print_usage(argv[0]);
                return EXIT_FAILURE;
        }
    }

    std::string config_error;
    if (!beatconsensus::resolve_consensus_config(overrides, &config, &config_error)) {
        std::cerr << "Invalid options: " << config_error << "\n";
        return EXIT_FAILURE;
    }
    beatconsensus::set_log_verbosity_from_config(config);

    if (argc - optind > 1) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::vector<beatconsensus::TempoEstimate> estimates;
    beatconsensus::ValidationError error;
    bool read_ok = false;
    if (optind < argc) {
        const std::string input_path = argv[optind];
        std::ifstream input(input_path);
        if (!input.is_open()) {
            BEATCONSENSUS_LOG_ERROR("Failed to open input file '" << input_path << "'");
            return EXIT_FAILURE;
        }
        read_ok = beatconsensus::read_estimate_triples(input, &estimates, &error);
    } else {
        read_ok = beatconsensus::read_estimate_triples(std::cin, &estimates, &error);
    }
    if (!read_ok) {
        BEATCONSENSUS_LOG_ERROR(beatconsensus::describe_validation_error(error));
        return EXIT_FAILURE;
    }

    beatconsensus::EstimateStore store;
    if (!beatconsensus::ingest_and_freeze(store, estimates, &error)) {
        BEATCONSENSUS_LOG_ERROR(beatconsensus::describe_validation_error(error));
        return EXIT_FAILURE;
    }
    BEATCONSENSUS_LOG_INFO("Ingested " << store.record_count() << " estimates for "
                           << store.file_count() << " files and "
                           << store.method_count() << " methods");

    beatconsensus::ConsensusReport report;
    if (!beatconsensus::build_consensus_report(store, config, &report, &error)) {
        BEATCONSENSUS_LOG_ERROR(beatconsensus::describe_validation_error(error));
        return EXIT_FAILURE;
    }

    const std::string text = beatconsensus::format_summary_report(report);
    if (output_path.empty()) {
        std::cout << text;
        return EXIT_SUCCESS;
    }

    std::string write_error;
    if (!beatconsensus::write_text_file(output_path, text, &write_error)) {
        BEATCONSENSUS_LOG_ERROR(write_error);
        return EXIT_FAILURE;
    }
    std::cout << "Summary report saved to " << output_path << "\n\n";
    std::cout << beatconsensus::format_console_summary(report, config.console_top_variance);
    return EXIT_SUCCESS;
}
