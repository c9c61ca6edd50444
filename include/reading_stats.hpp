//
//  reading_stats.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

#include "subtitle_interval.hpp"

namespace subforge {

enum class DurationVerdict { Good, TooShort, TooLong };

// Reading-comfort numbers shown next to the text editor.
struct ReadingStats {
    double duration = 0;
    size_t words = 0;
    size_t characters = 0;  // UTF-8 code points
    int words_per_minute = 0;

    DurationVerdict duration_verdict = DurationVerdict::TooShort;
    bool length_ok = true;  // <= kMaxWords
    bool speed_ok = true;   // <= kMaxWordsPerMinute
};

inline constexpr double kMinComfortDuration = 2.0;
inline constexpr double kMaxComfortDuration = 6.0;
inline constexpr size_t kMaxWords = 8;
inline constexpr int kMaxWordsPerMinute = 180;

// Byte length of the whitespace character starting at `pos`, 0 if there is none. Knows
// ASCII whitespace plus the UTF-8 encoded Unicode spaces (NBSP, U+1680, U+2000-U+200A,
// U+2028/2029, U+202F, U+205F, U+3000, U+FEFF).
size_t whitespace_length(std::string_view text, size_t pos);
// Empty or whitespace only.
bool is_blank(std::string_view text);

size_t count_words(std::string_view text);
size_t count_code_points(std::string_view text);

// Rounded words per minute; 0 when the duration is not positive or the text is empty.
int words_per_minute(size_t words, double duration_seconds);

ReadingStats compute_reading_stats(const SubtitleInterval &interval);

const char *to_string(DurationVerdict verdict);

}  // namespace subforge
