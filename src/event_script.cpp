//
//  event_script.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "event_script.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

#include "interval_store.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace {

using subforge::ScriptAction;

const std::pair<const char *, ScriptAction> kActionNames[] = {
    {"press", ScriptAction::Press},
    {"move", ScriptAction::Move},
    {"release", ScriptAction::Release},
    {"cancel", ScriptAction::Cancel},
    {"click", ScriptAction::Click},
    {"double_click", ScriptAction::DoubleClick},
    {"zoom_in", ScriptAction::ZoomIn},
    {"zoom_out", ScriptAction::ZoomOut},
    {"pan", ScriptAction::Pan},
    {"track_width", ScriptAction::TrackWidth},
    {"playhead", ScriptAction::Playhead},
    {"seek", ScriptAction::Seek},
    {"duration", ScriptAction::Duration},
    {"select", ScriptAction::Select},
    {"select_from_list", ScriptAction::SelectFromList},
    {"delete", ScriptAction::Delete},
    {"create", ScriptAction::Create},
    {"insert_after", ScriptAction::InsertAfter},
    {"text", ScriptAction::Text},
    {"start", ScriptAction::StartTime},
    {"end", ScriptAction::EndTime},
    {"flush", ScriptAction::Flush},
    {"tick", ScriptAction::Tick},
};

// Which JSON key carries ScriptEvent::number for an action.
const char *number_key(ScriptAction action) {
    switch (action) {
        case ScriptAction::Pan:
            return "fraction";
        case ScriptAction::TrackWidth:
            return "px";
        case ScriptAction::Playhead:
        case ScriptAction::Seek:
            return "time";
        case ScriptAction::Duration:
            return "seconds";
        case ScriptAction::Create:
            return "start";
        default:
            return nullptr;
    }
}

subforge::ScriptReadResult parse_events(std::istream &in, const std::string &origin) {
    subforge::ScriptReadResult res;
    try {
        json j;
        in >> j;
        const json *list = &j;
        if (j.is_object() && j.contains("events")) {
            list = &j["events"];
        }
        if (!list->is_array()) {
            res.status = subforge::make_status(false, origin + ": expected an array of events");
            SF_LOG("error", res.status.message);
            return res;
        }
        int64_t last_ms = 0;
        for (const auto &e : *list) {
            const std::string name = e.value("action", "");
            auto action = subforge::parse_script_action(name);
            if (!action) {
                res.status = subforge::make_status(
                    false, origin + ": unknown action \"" + name + "\" at event " +
                               std::to_string(res.events.size()));
                SF_LOG("error", res.status.message);
                return res;
            }
            subforge::ScriptEvent ev;
            ev.action = *action;
            ev.at_ms = std::max(last_ms, e.value("at_ms", last_ms));
            last_ms = ev.at_ms;
            ev.x = e.value("x", 0.0);
            if (const char *key = number_key(ev.action)) {
                ev.number = e.value(key, 0.0);
            }
            ev.end = e.value("end", 0.0);
            ev.id = e.value("id", "");
            if (ev.action == ScriptAction::StartTime || ev.action == ScriptAction::EndTime) {
                ev.text = e.value("value", "");
            } else {
                ev.text = e.value("text", "");
            }
            res.events.push_back(std::move(ev));
        }
    } catch (const json::exception &e) {
        res.status = subforge::make_status(false, origin + ": " + e.what());
        SF_LOG("error", res.status.message);
        return res;
    }
    res.status = subforge::make_status(true);
    SF_LOG("io", "read " << res.events.size() << " events from " << origin);
    return res;
}

}  // namespace

namespace subforge {

std::optional<ScriptAction> parse_script_action(const std::string &name) {
    for (const auto &entry : kActionNames) {
        if (name == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

const char *to_string(ScriptAction action) {
    for (const auto &entry : kActionNames) {
        if (entry.second == action) {
            return entry.first;
        }
    }
    return "unknown";
}

ScriptReadResult read_event_script(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        ScriptReadResult res;
        res.status = make_status(false, "open failed for " + path + " (" +
                                            std::generic_category().message(errno) + ")");
        SF_LOG("error", res.status.message);
        return res;
    }
    return parse_events(f, path);
}

ScriptReadResult parse_event_script(const std::string &json_text) {
    std::istringstream in(json_text);
    return parse_events(in, "<memory>");
}

Status replay_events(EditorSession &session, const std::vector<ScriptEvent> &events) {
    const auto origin = EditorSession::Clock::now();
    for (size_t i = 0; i < events.size(); ++i) {
        const auto &ev = events[i];
        const auto now = origin + std::chrono::milliseconds(ev.at_ms);
        session.tick(now);
        SF_LOG("replay", "#" << i << " " << to_string(ev.action) << " at " << ev.at_ms << "ms");

        auto target = [&]() -> std::optional<IntervalId> {
            if (!ev.id.empty()) {
                return ev.id;
            }
            return session.selection();
        };
        auto fail = [&](const std::string &why) {
            std::string msg =
                "event #" + std::to_string(i) + " (" + to_string(ev.action) + "): " + why;
            SF_LOG("error", msg);
            return make_status(false, msg);
        };

        switch (ev.action) {
            case ScriptAction::Press:
                session.handle_pointer({PointerAction::Press, ev.x});
                break;
            case ScriptAction::Move:
                session.handle_pointer({PointerAction::Move, ev.x});
                break;
            case ScriptAction::Release:
                session.handle_pointer({PointerAction::Release, ev.x});
                break;
            case ScriptAction::Cancel:
                session.handle_pointer({PointerAction::Cancel, ev.x});
                break;
            case ScriptAction::Click:
                session.handle_pointer({PointerAction::Press, ev.x});
                session.handle_pointer({PointerAction::Release, ev.x});
                break;
            case ScriptAction::DoubleClick:
                session.handle_pointer({PointerAction::DoubleClick, ev.x});
                break;
            case ScriptAction::ZoomIn:
                session.zoom_in();
                break;
            case ScriptAction::ZoomOut:
                session.zoom_out();
                break;
            case ScriptAction::Pan:
                session.pan_by(ev.number);
                break;
            case ScriptAction::TrackWidth:
                session.set_track_width(ev.number);
                break;
            case ScriptAction::Playhead:
                session.on_time_update(ev.number);
                break;
            case ScriptAction::Seek:
                session.seek(ev.number);
                break;
            case ScriptAction::Duration:
                session.on_duration_ready(ev.number);
                break;
            case ScriptAction::Select:
                if (!session.select(ev.id)) {
                    return fail("unknown subtitle " + ev.id);
                }
                break;
            case ScriptAction::SelectFromList:
                if (!session.select_from_list(ev.id)) {
                    return fail("unknown subtitle " + ev.id);
                }
                break;
            case ScriptAction::Delete:
                session.remove(ev.id);
                break;
            case ScriptAction::Create:
                try {
                    session.create(ev.number, ev.end, ev.text);
                } catch (const InvalidRangeError &e) {
                    return fail(e.what());
                }
                break;
            case ScriptAction::InsertAfter: {
                if (!ev.id.empty()) {
                    session.insert_after(ev.id);
                    break;
                }
                // Segmenting key while the selection is being edited.
                if (!session.selection()) {
                    return fail("nothing selected");
                }
                session.insert_after_selection();
                break;
            }
            case ScriptAction::Text:
            case ScriptAction::StartTime:
            case ScriptAction::EndTime: {
                auto id = target();
                if (!id || !session.store().contains(*id)) {
                    return fail("no subtitle to edit");
                }
                if (ev.action == ScriptAction::Text) {
                    session.stage_text(*id, ev.text, now);
                } else if (ev.action == ScriptAction::StartTime) {
                    session.stage_start_text(*id, ev.text, now);
                } else {
                    session.stage_end_text(*id, ev.text, now);
                }
                break;
            }
            case ScriptAction::Flush:
                session.flush_edits();
                break;
            case ScriptAction::Tick:
                break;
        }
    }
    session.flush_edits();
    return make_status(true);
}

}  // namespace subforge
