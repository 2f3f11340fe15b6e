//
//  formatter.cpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "beatconsensus/report.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace beatconsensus {

namespace {

constexpr std::size_t kBannerWidth = 80;
constexpr std::size_t kSectionRuleWidth = 40;
constexpr std::size_t kVarianceRuleWidth = 60;

std::string one_decimal(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

// Thresholds print without trailing zeros ("20", "12.5").
std::string plain_number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

std::string join_methods(const std::vector<MethodName>& methods) {
    std::string out;
    for (std::size_t i = 0; i < methods.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += methods[i];
    }
    return out;
}

void write_method_stats(std::ostream& out, const std::vector<MethodStats>& stats) {
    out << "Method Statistics:\n";
    out << std::string(kSectionRuleWidth, '-') << "\n";
    for (const auto& entry : stats) {
        out << entry.method << ":\n";
        if (entry.has_data()) {
            out << "  Average BPM: " << one_decimal(entry.mean_bpm) << "\n";
            out << "  Range: " << one_decimal(entry.min_bpm) << " - "
                << one_decimal(entry.max_bpm) << "\n";
        } else {
            out << "  Average BPM: no data\n";
            out << "  Range: no data\n";
        }
        out << "  Files processed: " << entry.count << "/" << entry.total_files << "\n\n";
    }
}

void write_high_variance(std::ostream& out, const ConsensusReport& report) {
    out << "Files with High Variance (>" << plain_number(report.variance_threshold_bpm)
        << " BPM difference):\n";
    out << std::string(kVarianceRuleWidth, '-') << "\n";
    if (report.high_variance.empty()) {
        out << "No files with high variance found.\n";
        return;
    }
    for (const auto& record : report.high_variance) {
        out << "\n" << record.file_id << ":\n";
        for (const auto& method : report.methods) {
            const auto it = record.bpm_by_method.find(method);
            if (it == record.bpm_by_method.end()) {
                out << "  " << method << ": no result\n";
                continue;
            }
            out << "  " << method << ": " << one_decimal(it->second) << " BPM\n";
        }
        out << "  Spread: " << one_decimal(record.spread) << " BPM\n";
    }
}

void write_agreement(std::ostream& out, const std::vector<PairAgreement>& agreements) {
    out << "Method Agreement Analysis:\n";
    out << std::string(kSectionRuleWidth, '-') << "\n";
    if (agreements.empty()) {
        out << "No method pairs to compare.\n";
        return;
    }
    for (const auto& pair : agreements) {
        out << pair.method_a << " vs " << pair.method_b << ": ";
        if (!pair.defined()) {
            out << "undefined (0/0 files compared)\n";
            continue;
        }
        out << one_decimal(pair.percentage) << "% agreement (" << pair.agreeing << "/"
            << pair.compared << " files)\n";
    }
}

} // namespace

std::string format_summary_report(const ConsensusReport& report) {
    std::ostringstream out;
    out << "BPM Detection Summary Report\n";
    out << std::string(kBannerWidth, '=') << "\n\n";

    out << "Total files analyzed: " << report.total_files << "\n";
    out << "Methods used: " << join_methods(report.methods) << "\n\n";

    write_method_stats(out, report.method_stats);
    write_high_variance(out, report);
    out << "\n";
    write_agreement(out, report.agreements);

    out << "\n" << std::string(kBannerWidth, '=') << "\n";
    out << "Report generated successfully.\n";
    return out.str();
}

std::string format_console_summary(const ConsensusReport& report, std::size_t top_n) {
    std::ostringstream out;
    const std::string rule(60, '=');
    out << rule << "\n";
    out << "BPM DETECTION SUMMARY\n";
    out << rule << "\n";
    out << "Files analyzed: " << report.total_files << "\n";
    out << "Methods used: " << join_methods(report.methods) << "\n";

    if (!report.high_variance.empty()) {
        out << "\nFiles with high BPM variance (>" << plain_number(report.variance_threshold_bpm)
            << " BPM): " << report.high_variance.size() << "\n";
        const std::size_t shown = std::min(top_n, report.high_variance.size());
        for (std::size_t i = 0; i < shown; ++i) {
            const auto& record = report.high_variance[i];
            out << "  - " << record.file_id << ": " << one_decimal(record.spread)
                << " BPM difference\n";
        }
    }
    out << rule << "\n";
    return out.str();
}

} // namespace beatconsensus
