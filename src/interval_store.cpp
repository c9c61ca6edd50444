//
//  interval_store.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "interval_store.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "logging.hpp"

namespace {

// Keep both bounds within [0, kMaxTime] and widen end so the minimum duration holds. At
// the upper limit start moves back instead.
void normalise(double &start, double &end) {
    using subforge::kMaxTime;
    using subforge::kMinIntervalDuration;
    start = std::max(0.0, start);
    end = std::min(end, kMaxTime);
    if (end - start >= kMinIntervalDuration) {
        return;
    }
    end = start + kMinIntervalDuration;
    // start + 0.1 may round to a difference a hair below 0.1.
    while (end - start < kMinIntervalDuration) {
        end = std::nextafter(end, std::numeric_limits<double>::infinity());
    }
    if (end > kMaxTime) {
        end = kMaxTime;
        start = kMaxTime - kMinIntervalDuration;
        while (end - start < kMinIntervalDuration) {
            start = std::nextafter(start, -std::numeric_limits<double>::infinity());
        }
    }
}

bool in_range(double t) { return std::isfinite(t) && t <= subforge::kMaxTime; }

}  // namespace

namespace subforge {

void apply_patch(SubtitleInterval &interval, const IntervalPatch &patch) {
    const double old_duration = interval.duration();
    const double carry = old_duration >= kMinIntervalDuration ? old_duration : kDegenerateCarry;
    double start = interval.start;
    double end = interval.end;

    if (patch.start && patch.end) {
        start = *patch.start;
        end = *patch.end;
    } else if (patch.start) {
        start = std::max(0.0, *patch.start);
        if (start >= end) {
            end = start + carry;
        }
    } else if (patch.end) {
        end = *patch.end;
        if (end <= start) {
            start = std::max(0.0, end - carry);
        }
    }
    normalise(start, end);

    interval.start = start;
    interval.end = end;
    if (patch.text) {
        interval.text = *patch.text;
    }
}

IntervalId IntervalStore::next_id() {
    IntervalId id;
    do {
        id = "subtitle-" + std::to_string(++id_counter_);
    } while (contains(id));
    return id;
}

IntervalId IntervalStore::create(double start, double end, std::string text) {
    if (!in_range(start) || !in_range(end) || end <= start) {
        std::ostringstream oss;
        oss << "invalid subtitle range [" << start << ", " << end << "]";
        throw InvalidRangeError(oss.str());
    }
    normalise(start, end);
    SubtitleInterval interval;
    interval.id = next_id();
    interval.start = start;
    interval.end = end;
    interval.text = std::move(text);
    SF_LOG("store", "create " << interval.id << " [" << seconds_str(start) << ", "
                              << seconds_str(end) << "]");
    intervals_.push_back(std::move(interval));
    return intervals_.back().id;
}

bool IntervalStore::restore(SubtitleInterval interval) {
    if (interval.id.empty() || contains(interval.id)) {
        SF_LOG("warn", "cannot restore subtitle with empty or duplicate id \"" << interval.id
                                                                              << "\"");
        return false;
    }
    if (!in_range(interval.start) || !in_range(interval.end) || interval.end <= interval.start) {
        SF_LOG("warn", "cannot restore subtitle " << interval.id << " with range ["
                                                  << interval.start << ", " << interval.end
                                                  << "]");
        return false;
    }
    normalise(interval.start, interval.end);
    intervals_.push_back(std::move(interval));
    return true;
}

bool IntervalStore::update(const IntervalId &id, const IntervalPatch &patch) {
    SubtitleInterval *interval = find(id);
    if (!interval) {
        SF_LOG("warn", "update of unknown subtitle " << id);
        return false;
    }
    if ((patch.start && !in_range(*patch.start)) || (patch.end && !in_range(*patch.end))) {
        SF_LOG("warn", "update of " << id << " carries a time outside [0, "
                                    << seconds_str(kMaxTime) << "]; ignored");
        return false;
    }

    apply_patch(*interval, patch);
    SF_LOG("store", "update " << id << " [" << seconds_str(interval->start) << ", "
                              << seconds_str(interval->end) << "]"
                              << (patch.text ? " +text" : ""));
    return true;
}

void IntervalStore::remove(const IntervalId &id) {
    auto it = std::remove_if(intervals_.begin(), intervals_.end(),
                             [&](const SubtitleInterval &s) { return s.id == id; });
    if (it != intervals_.end()) {
        SF_LOG("store", "remove " << id);
        intervals_.erase(it, intervals_.end());
    }
}

void IntervalStore::clear() {
    intervals_.clear();
    id_counter_ = 0;
}

std::vector<SubtitleInterval> IntervalStore::query(const Predicate &pred) const {
    std::vector<SubtitleInterval> out;
    for (const auto &s : intervals_) {
        if (!pred || pred(s)) {
            out.push_back(s);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const SubtitleInterval &a, const SubtitleInterval &b) {
                         return a.start < b.start;
                     });
    return out;
}

std::vector<SubtitleInterval> IntervalStore::all() const { return query(nullptr); }

std::optional<SubtitleInterval> IntervalStore::get(const IntervalId &id) const {
    const SubtitleInterval *s = find(id);
    if (!s) {
        return std::nullopt;
    }
    return *s;
}

bool IntervalStore::contains(const IntervalId &id) const { return find(id) != nullptr; }

SubtitleInterval *IntervalStore::find(const IntervalId &id) {
    for (auto &s : intervals_) {
        if (s.id == id) {
            return &s;
        }
    }
    return nullptr;
}

const SubtitleInterval *IntervalStore::find(const IntervalId &id) const {
    for (const auto &s : intervals_) {
        if (s.id == id) {
            return &s;
        }
    }
    return nullptr;
}

}  // namespace subforge
