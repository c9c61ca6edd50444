//
//  event_script.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "editor_session.hpp"
#include "status.hpp"

namespace subforge {

enum class ScriptAction {
    Press,
    Move,
    Release,
    Cancel,
    Click,
    DoubleClick,
    ZoomIn,
    ZoomOut,
    Pan,
    TrackWidth,
    Playhead,
    Seek,
    Duration,
    Select,
    SelectFromList,
    Delete,
    Create,
    InsertAfter,
    Text,
    StartTime,
    EndTime,
    Flush,
    Tick,
};

/**
 * @brief One recorded editor input.
 *
 * JSON form: `{ "action": "press", "x": 120, "at_ms": 40 }`. `at_ms` is the time since the
 * start of the script and drives the autosave clock; it never decreases. Fields not used
 * by an action are ignored.
 *
 * Actions and their fields:
 * - press/move/release/cancel/click/double_click: `x` (track pixels)
 * - zoom_in/zoom_out; pan: `fraction`; track_width: `px` (timeline resized)
 * - playhead/seek: `time`; duration: `seconds`
 * - select/select_from_list/delete: `id`
 * - create: `start`, `end`, `text`; insert_after: `id` (defaults to the selection)
 * - text: `id`, `text`; start/end: `id`, `value` ("HH:MM:SS.mmm")
 * - flush; tick
 */
struct ScriptEvent {
    ScriptAction action = ScriptAction::Tick;
    int64_t at_ms = 0;
    double x = 0;
    double number = 0;  // fraction/px/time/seconds/start, depending on the action
    double end = 0;
    std::string id;
    std::string text;  // text or time field value
};

struct ScriptReadResult {
    Status status;
    std::vector<ScriptEvent> events;
};

std::optional<ScriptAction> parse_script_action(const std::string &name);
const char *to_string(ScriptAction action);

ScriptReadResult read_event_script(const std::string &path);
ScriptReadResult parse_event_script(const std::string &json_text);

// Feed events into the session, ticking the autosave clock after each one. Stops at the
// first event that cannot be applied. Pending edits are flushed at the end.
Status replay_events(EditorSession &session, const std::vector<ScriptEvent> &events);

}  // namespace subforge
