//
//  reading_stats.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "reading_stats.hpp"

#include <cctype>
#include <cmath>

namespace subforge {

size_t whitespace_length(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }
    const auto byte = [&](size_t i) {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0u;
    };
    const unsigned b0 = byte(pos);
    if (b0 < 0x80) {
        return std::isspace(static_cast<int>(b0)) != 0 ? 1 : 0;
    }
    const unsigned b1 = byte(pos + 1);
    const unsigned b2 = byte(pos + 2);
    if (b0 == 0xC2 && b1 == 0xA0) {
        return 2;
    }
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x80 &&
        ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) {
        return 3;
    }
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) {
        return 3;
    }
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
        return 3;
    }
    return 0;
}

bool is_blank(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t n = whitespace_length(text, pos);
        if (n == 0) {
            return false;
        }
        pos += n;
    }
    return true;
}

size_t count_words(std::string_view text) {
    size_t words = 0;
    bool in_word = false;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t n = whitespace_length(text, pos);
        if (n > 0) {
            in_word = false;
            pos += n;
            continue;
        }
        if (!in_word) {
            ++words;
        }
        in_word = true;
        ++pos;
    }
    return words;
}

size_t count_code_points(std::string_view text) {
    size_t n = 0;
    for (char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

int words_per_minute(size_t words, double duration_seconds) {
    if (words == 0 || !(duration_seconds > 0.0)) {
        return 0;
    }
    const double minutes = duration_seconds / 60.0;
    return static_cast<int>(std::lround(static_cast<double>(words) / minutes));
}

ReadingStats compute_reading_stats(const SubtitleInterval &interval) {
    ReadingStats stats;
    stats.duration = interval.duration();
    stats.words = count_words(interval.text);
    stats.characters = count_code_points(interval.text);
    stats.words_per_minute = words_per_minute(stats.words, stats.duration);

    if (stats.duration < kMinComfortDuration) {
        stats.duration_verdict = DurationVerdict::TooShort;
    } else if (stats.duration > kMaxComfortDuration) {
        stats.duration_verdict = DurationVerdict::TooLong;
    } else {
        stats.duration_verdict = DurationVerdict::Good;
    }
    stats.length_ok = stats.words <= kMaxWords;
    stats.speed_ok = stats.words_per_minute <= kMaxWordsPerMinute;
    return stats;
}

const char *to_string(DurationVerdict verdict) {
    switch (verdict) {
        case DurationVerdict::Good:
            return "good";
        case DurationVerdict::TooShort:
            return "too short";
        case DurationVerdict::TooLong:
            return "too long";
    }
    return "unknown";
}

}  // namespace subforge
