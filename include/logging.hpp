//
//  logging.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Fixed-precision seconds for log lines (e.g. "12.345s").
inline std::string seconds_str(double seconds, int precision = 3) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << seconds << "s";
    return oss.str();
}

}  // namespace subforge

inline constexpr subforge::LogVerbosity sf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return subforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return subforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return subforge::LogVerbosity::Info;
    }
    // Everything else (store/drag/io/etc.) treated as debug-level.
    return subforge::LogVerbosity::Debug;
}

inline bool sf_should_log(const char* level) {
    const auto current = subforge::get_log_verbosity();
    const auto sev = sf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void sf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[SubForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[SubForge][" << level << "] " << msg << std::endl;
    }
}

#define SF_LOG(level, message)                                              \
    do {                                                                    \
        if (sf_should_log(level)) {                                         \
            std::ostringstream _sf_log_ss;                                  \
            _sf_log_ss << message;                                          \
            sf_log_impl(level, _sf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
