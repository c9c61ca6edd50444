//
//  subtitle_interval.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

namespace subforge {

/// Minimum duration (seconds) of every stored interval.
inline constexpr double kMinIntervalDuration = 0.1;

/// Largest accepted time (99:59:59.999), the limit of the two-digit hour field.
inline constexpr double kMaxTime = 359999.999;

using IntervalId = std::string;

/// @ingroup api
/// One subtitle: a time span on the media timeline plus its text.
struct SubtitleInterval {
    IntervalId id;      ///< Opaque, stable for the interval's lifetime
    double start = 0;   ///< Start in seconds (>= 0)
    double end = 0;     ///< End in seconds (>= start + kMinIntervalDuration)
    std::string text;   ///< UTF-8 text, may be empty

    double duration() const { return end - start; }
    bool contains(double t) const { return t >= start && t <= end; }
};

/// @ingroup api
/// Partial change applied through IntervalStore::update. Unset fields stay untouched.
struct IntervalPatch {
    std::optional<double> start;
    std::optional<double> end;
    std::optional<std::string> text;

    bool empty() const { return !start && !end && !text; }
};

}  // namespace subforge
