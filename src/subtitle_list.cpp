//
//  subtitle_list.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "subtitle_list.hpp"

#include <cctype>
#include <string>

#include "subtitle_timing.hpp"

namespace {

std::string lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace

namespace subforge {

bool matches_search(const SubtitleInterval &interval, std::string_view term) {
    if (term.empty()) {
        return true;
    }
    if (lower_ascii(interval.text).find(lower_ascii(term)) != std::string::npos) {
        return true;
    }
    return format_short_time(interval.start).find(term) != std::string::npos ||
           format_short_time(interval.end).find(term) != std::string::npos;
}

std::vector<ListEntry> project_list(const IntervalStore &store, std::string_view term,
                                    const std::optional<IntervalId> &selected) {
    const auto matches =
        store.query([&](const SubtitleInterval &s) { return matches_search(s, term); });
    std::vector<ListEntry> rows;
    rows.reserve(matches.size());
    for (size_t i = 0; i < matches.size(); ++i) {
        ListEntry row;
        row.number = i + 1;
        row.interval = matches[i];
        row.selected = selected && *selected == matches[i].id;
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace subforge
