//
//  logging.hpp
//  BeatConsensus
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace beatconsensus {

struct ConsensusConfig;

/// @brief Severity levels of consensus runs, lowest number = most severe.
///
/// What goes where:
/// - `Error`: the run stops, e.g. a duplicate or non-positive estimate in the
///   input, an unfrozen store handed to an analysis, or an unwritable report.
/// - `Warn`: the report is still produced but will look odd, e.g. a method
///   with zero coverage over the corpus.
/// - `Info`: ingest counts and `--profile` timing lines.
/// - `Debug`: one line per skipped file, compared pair or flagged spread.
///
/// The process-wide level is the only filter; call sites never wrap `Warn` or
/// `Error` logs in their own flags.
enum class LogVerbosity {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

/// @brief `verbose` selects Debug, `profile` selects Info, neither leaves Warn.
void set_log_verbosity_from_config(const ConsensusConfig& config);

} // namespace beatconsensus

inline constexpr beatconsensus::LogVerbosity beatconsensus_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return beatconsensus::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return beatconsensus::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return beatconsensus::LogVerbosity::Info;
    }
    return beatconsensus::LogVerbosity::Debug;
}

inline bool beatconsensus_should_log(const char* level) {
    const auto current = beatconsensus::get_log_verbosity();
    const auto severity = beatconsensus_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void beatconsensus_log_impl(const char* level,
                                   const std::string& message,
                                   const char* file,
                                   int line,
                                   const char* func) {
    const std::string label = level ? level : "";
    if (label == "error") {
        std::cerr << "[BeatConsensus][" << label << "][" << file << ":" << line
                  << " " << func << "] " << message << "\n";
        return;
    }

    std::cerr << "[BeatConsensus][" << label << "] " << message << "\n";
}

inline void beatconsensus_log_multiline_impl(const char* level,
                                             const std::string& message,
                                             const char* file,
                                             int line,
                                             const char* func) {
    if (message.empty()) {
        beatconsensus_log_impl(level, message, file, line, func);
        return;
    }

    std::size_t start = 0;
    while (start <= message.size()) {
        const std::size_t end = message.find('\n', start);
        const std::size_t len =
            (end == std::string::npos) ? (message.size() - start) : (end - start);
        const std::string line_msg = message.substr(start, len);
        if (!line_msg.empty()) {
            beatconsensus_log_impl(level, line_msg, file, line, func);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

namespace beatconsensus {

/// @brief Collects one message over several `<<` statements (e.g. a loop over
/// method pairs) and emits it on destruction, one log line per text line.
/// Nothing is formatted when the level is filtered out.
class LogStream {
public:
    LogStream(const char* level, const char* file, int line, const char* func)
        : level_(level),
          file_(file),
          line_(line),
          func_(func),
          enabled_(beatconsensus_should_log(level)) {}

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (enabled_) {
            manip(stream_);
        }
        return *this;
    }

    ~LogStream() {
        if (!enabled_) {
            return;
        }
        beatconsensus_log_multiline_impl(level_, stream_.str(), file_, line_, func_);
    }

private:
    const char* level_ = nullptr;
    const char* file_ = nullptr;
    int line_ = 0;
    const char* func_ = nullptr;
    bool enabled_ = false;
    std::ostringstream stream_;
};

} // namespace beatconsensus

#define BEATCONSENSUS_LOG(level, message)                                        \
    do {                                                                         \
        if (beatconsensus_should_log(level)) {                                   \
            std::ostringstream _beatconsensus_log_stream;                        \
            _beatconsensus_log_stream << message;                                \
            beatconsensus_log_multiline_impl(level,                              \
                                             _beatconsensus_log_stream.str(),    \
                                             __FILE__,                           \
                                             __LINE__,                           \
                                             __func__);                          \
        }                                                                        \
    } while (0)

#define BEATCONSENSUS_LOG_STREAM(level) \
    ::beatconsensus::LogStream(level, __FILE__, __LINE__, __func__)
#define BEATCONSENSUS_LOG_ERROR_STREAM() BEATCONSENSUS_LOG_STREAM("error")
#define BEATCONSENSUS_LOG_WARN_STREAM() BEATCONSENSUS_LOG_STREAM("warn")
#define BEATCONSENSUS_LOG_INFO_STREAM() BEATCONSENSUS_LOG_STREAM("info")
#define BEATCONSENSUS_LOG_DEBUG_STREAM() BEATCONSENSUS_LOG_STREAM("debug")

#define BEATCONSENSUS_LOG_ERROR(message) BEATCONSENSUS_LOG("error", message)
#define BEATCONSENSUS_LOG_WARN(message) BEATCONSENSUS_LOG("warn", message)
#define BEATCONSENSUS_LOG_INFO(message) BEATCONSENSUS_LOG("info", message)
#define BEATCONSENSUS_LOG_DEBUG(message) BEATCONSENSUS_LOG("debug", message)
