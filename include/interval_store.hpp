//
//  interval_store.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "subtitle_interval.hpp"

namespace subforge {

// Thrown by IntervalStore::create when end <= start.
class InvalidRangeError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Apply a partial change to `interval` with the store's correction rules: moving one bound
// across the other carries the previous duration along, start is clamped at 0 and the
// minimum duration is restored by widening end. Both bounds in one patch apply jointly.
// Non-finite times and times above kMaxTime must be rejected by the caller.
void apply_patch(SubtitleInterval &interval, const IntervalPatch &patch);

// Carried across instead of the previous duration when that one was degenerate.
inline constexpr double kDegenerateCarry = 1.0;

/**
 * @brief Authoritative owner of all subtitle intervals of a session.
 *
 * Every mutation leaves each interval with start >= 0 and end - start >= kMinIntervalDuration.
 * Intervals are kept in creation order; reads return copies sorted by start (stable, so ties
 * keep creation order). Overlap is allowed.
 */
class IntervalStore {
   public:
    using Predicate = std::function<bool(const SubtitleInterval &)>;

    // Append a new interval; end is widened to the minimum duration if needed.
    IntervalId create(double start, double end, std::string text = {});

    // Re-insert an interval with a known id (project load). Fails on id collisions or
    // inverted ranges.
    bool restore(SubtitleInterval interval);

    // Apply a partial change. Returns false when the id is unknown or a time is not finite
    // or above kMaxTime.
    bool update(const IntervalId &id, const IntervalPatch &patch);

    // Drop an interval; unknown ids are ignored.
    void remove(const IntervalId &id);

    void clear();

    std::vector<SubtitleInterval> query(const Predicate &pred) const;
    std::vector<SubtitleInterval> all() const;
    std::vector<SubtitleInterval> in_creation_order() const { return intervals_; }

    std::optional<SubtitleInterval> get(const IntervalId &id) const;
    bool contains(const IntervalId &id) const;
    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }

   private:
    SubtitleInterval *find(const IntervalId &id);
    const SubtitleInterval *find(const IntervalId &id) const;
    IntervalId next_id();

    std::vector<SubtitleInterval> intervals_;
    uint64_t id_counter_ = 0;
};

}  // namespace subforge
