//
//  gap_fill.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gap_fill.hpp"

#include <algorithm>
#include <cmath>

#include "logging.hpp"

namespace subforge {

std::optional<GapRange> find_gap(const std::vector<SubtitleInterval> &existing, double t,
                                 double total_duration, double default_duration) {
    if (!std::isfinite(t) || t < 0.0 || total_duration <= 0.0) {
        return std::nullopt;
    }
    double last_end = 0.0;
    double next_start = total_duration;
    for (const auto &s : existing) {
        if (s.end <= t) {
            last_end = std::max(last_end, s.end);
        }
        if (s.start >= t) {
            next_start = std::min(next_start, s.start);
        }
        // `t` inside an interval: any start >= t would overlap it.
        if (s.start < t && s.end > t) {
            SF_LOG("gapfill", "t=" << seconds_str(t) << " lies inside " << s.id);
            return std::nullopt;
        }
    }
    GapRange gap;
    gap.start = std::max(t, last_end);
    gap.end = std::min({gap.start + default_duration, next_start, total_duration, kMaxTime});
    if (gap.end - gap.start < kMinIntervalDuration) {
        SF_LOG("gapfill", "no room at t=" << seconds_str(t) << " (next=" << seconds_str(next_start)
                                          << ")");
        return std::nullopt;
    }
    return gap;
}

std::optional<IntervalId> gap_fill_at(IntervalStore &store, double t, double total_duration,
                                      double default_duration) {
    auto gap = find_gap(store.all(), t, total_duration, default_duration);
    if (!gap) {
        return std::nullopt;
    }
    return store.create(gap->start, gap->end);
}

std::optional<IntervalId> gap_fill_after(IntervalStore &store, const IntervalId &anchor,
                                         double total_duration, double default_duration) {
    auto interval = store.get(anchor);
    if (!interval) {
        SF_LOG("warn", "insert after unknown subtitle " << anchor);
        return std::nullopt;
    }
    return gap_fill_at(store, interval->end, total_duration, default_duration);
}

}  // namespace subforge
