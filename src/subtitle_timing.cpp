//
//  subtitle_timing.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "subtitle_timing.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

#include "logging.hpp"
#include "subtitle_interval.hpp"

namespace {

// Keeps values like 1.001 (stored as 1.000999...) from flooring a full millisecond low.
constexpr double kFloorGuardMs = 1e-3;

// Formatters print at most 99:59:59.999.
double clamp_time(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return 0.0;
    }
    return std::min(seconds, subforge::kMaxTime);
}

int64_t floor_ms(double seconds) {
    return static_cast<int64_t>(std::floor(clamp_time(seconds) * 1000.0 + kFloorGuardMs));
}

std::string pad(int64_t value, int width) {
    std::ostringstream oss;
    oss << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

std::vector<std::string> split(std::string_view text, char sep) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        size_t next = text.find(sep, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(text.substr(pos));
            break;
        }
        parts.emplace_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

// Leading-number semantics: "12abc" -> 12, "abc" -> 0.
long parse_int_prefix(const std::string &s) {
    char *end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str()) {
        return 0;
    }
    return v;
}

double parse_float_prefix(std::string s) {
    std::replace(s.begin(), s.end(), ',', '.');
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || !std::isfinite(v)) {
        return 0.0;
    }
    return v;
}

}  // namespace

namespace subforge {

std::string format_timestamp(double seconds, char ms_separator) {
    const int64_t total_ms = floor_ms(seconds);
    const int64_t hours = total_ms / 3600000;
    const int64_t minutes = (total_ms / 60000) % 60;
    const int64_t secs = (total_ms / 1000) % 60;
    const int64_t millis = total_ms % 1000;
    return pad(hours, 2) + ":" + pad(minutes, 2) + ":" + pad(secs, 2) + ms_separator +
           pad(millis, 3);
}

std::string format_editor_time(double seconds) {
    seconds = clamp_time(seconds);
    const auto total_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    const int64_t hours = total_ms / 3600000;
    const int64_t minutes = (total_ms / 60000) % 60;
    const int64_t secs = (total_ms / 1000) % 60;
    const int64_t millis = total_ms % 1000;
    return pad(hours, 2) + ":" + pad(minutes, 2) + ":" + pad(secs, 2) + "." + pad(millis, 3);
}

std::string format_short_time(double seconds) {
    seconds = clamp_time(seconds);
    const auto total_cs = static_cast<int64_t>(std::llround(seconds * 100.0));
    const int64_t minutes = total_cs / 6000;
    const int64_t rem_cs = total_cs % 6000;
    std::ostringstream oss;
    oss << minutes << ":" << pad(rem_cs / 100, 2) << "." << pad(rem_cs % 100, 2);
    return oss.str();
}

double parse_time_text(std::string_view text) {
    const auto parts = split(text, ':');
    if (parts.size() != 3) {
        SF_LOG("debug", "time text \"" << text << "\" has " << parts.size()
                                       << " segments; reading as 0");
        return 0.0;
    }
    const long hours = parse_int_prefix(parts[0]);
    const long minutes = parse_int_prefix(parts[1]);
    const double secs = parse_float_prefix(parts[2]);
    return static_cast<double>(hours) * 3600.0 + static_cast<double>(minutes) * 60.0 + secs;
}

}  // namespace subforge
