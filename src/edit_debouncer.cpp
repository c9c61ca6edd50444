//
//  edit_debouncer.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "edit_debouncer.hpp"

#include <vector>

#include "logging.hpp"

namespace subforge {

void EditDebouncer::stage(const IntervalId &id, const IntervalPatch &patch,
                          Clock::time_point now) {
    auto &slot = pending_[id];
    if (patch.start) {
        slot.patch.start = patch.start;
    }
    if (patch.end) {
        slot.patch.end = patch.end;
    }
    if (patch.text) {
        slot.patch.text = patch.text;
    }
    slot.deadline = now + delay_;
}

size_t EditDebouncer::poll(Clock::time_point now, const Commit &commit) {
    // Collect first; the commit callback may stage again.
    std::vector<std::pair<IntervalId, IntervalPatch>> due;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.deadline <= now) {
            due.emplace_back(it->first, std::move(it->second.patch));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto &entry : due) {
        SF_LOG("autosave", "commit " << entry.first);
        if (commit) {
            commit(entry.first, entry.second);
        }
    }
    return due.size();
}

size_t EditDebouncer::flush_all(const Commit &commit) {
    auto drained = std::move(pending_);
    pending_.clear();
    for (const auto &entry : drained) {
        SF_LOG("autosave", "flush " << entry.first);
        if (commit) {
            commit(entry.first, entry.second.patch);
        }
    }
    return drained.size();
}

std::optional<IntervalPatch> EditDebouncer::pending_patch(const IntervalId &id) const {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second.patch;
}

}  // namespace subforge
