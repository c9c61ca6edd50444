//
//  subtitle_list.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "interval_store.hpp"
#include "subtitle_interval.hpp"

namespace subforge {

// One row of the subtitle list.
struct ListEntry {
    size_t number = 0;  // 1-based position within the filtered list
    SubtitleInterval interval;
    bool selected = false;
};

// Case-insensitive text match, or the term occurs in the short start/end time ("M:SS.ss").
// An empty term matches everything.
bool matches_search(const SubtitleInterval &interval, std::string_view term);

// Filtered, time-sorted read view of the store.
std::vector<ListEntry> project_list(const IntervalStore &store, std::string_view term,
                                    const std::optional<IntervalId> &selected = std::nullopt);

}  // namespace subforge
