//
//  gap_fill.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <vector>

#include "interval_store.hpp"
#include "subtitle_interval.hpp"

namespace subforge {

struct GapRange {
    double start = 0;
    double end = 0;
};

// Largest default-sized range starting at or after `t` that overlaps none of `existing` and
// stays within `total_duration`. nullopt when there is no room.
std::optional<GapRange> find_gap(const std::vector<SubtitleInterval> &existing, double t,
                                 double total_duration, double default_duration = 3.0);

// find_gap + IntervalStore::create. Returns the new id, or nullopt when the request was
// dropped for lack of space.
std::optional<IntervalId> gap_fill_at(IntervalStore &store, double t, double total_duration,
                                      double default_duration = 3.0);

// Same, anchored at the end of an existing interval ("insert after").
std::optional<IntervalId> gap_fill_after(IntervalStore &store, const IntervalId &anchor,
                                         double total_duration, double default_duration = 3.0);

}  // namespace subforge
