//
//  edit_debouncer.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>

#include "subtitle_interval.hpp"

namespace subforge {

// Coalesces rapid edits per interval: each stage() restarts that interval's quiet period,
// and at most one pending commit exists per id. Time is supplied by the caller so the
// owner's event loop drives it (poll on every tick).
class EditDebouncer {
   public:
    using Clock = std::chrono::steady_clock;
    using Commit = std::function<void(const IntervalId &, const IntervalPatch &)>;

    explicit EditDebouncer(std::chrono::milliseconds delay = std::chrono::milliseconds(500))
        : delay_(delay) {}

    // Merge `patch` over the pending one for `id` (newer fields win) and restart the timer.
    void stage(const IntervalId &id, const IntervalPatch &patch, Clock::time_point now);

    // Commit every edit whose quiet period has elapsed. Returns the number committed.
    size_t poll(Clock::time_point now, const Commit &commit);

    // Commit everything immediately.
    size_t flush_all(const Commit &commit);

    void cancel(const IntervalId &id) { pending_.erase(id); }

    size_t pending_count() const { return pending_.size(); }
    std::optional<IntervalPatch> pending_patch(const IntervalId &id) const;

   private:
    struct Pending {
        IntervalPatch patch;
        Clock::time_point deadline;
    };

    std::map<IntervalId, Pending> pending_;
    std::chrono::milliseconds delay_;
};

}  // namespace subforge
