//
//  subtitle_timing.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

namespace subforge {

// "HH:MM:SS<sep>mmm" with floor semantics per field. SRT uses ',' and WebVTT '.'.
std::string format_timestamp(double seconds, char ms_separator = ',');

// Editor time field, "HH:MM:SS.mmm" (seconds rounded to the millisecond).
std::string format_editor_time(double seconds);

// Compact list display, "M:SS.ss".
std::string format_short_time(double seconds);

// Lenient inverse of the timestamp formats. Anything not shaped like H:M:S yields 0;
// non-numeric fields count as 0. Accepts ',' or '.' before the milliseconds.
double parse_time_text(std::string_view text);

}  // namespace subforge
