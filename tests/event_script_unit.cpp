// Event script parsing and replay against a loaded project.
#include <cmath>
#include <iostream>
#include <string>

#include "editor_session.hpp"
#include "event_script.hpp"
#include "logging.hpp"
#include "project_io.hpp"

using namespace subforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[event_script_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

bool test_parse() {
    auto res = parse_event_script(R"([{"action": "zoom_in"}, {"action": "pan", "fraction": 0.5}])");
    bool ok = check(res.status.ok && res.events.size() == 2, "bare array accepted");
    ok &= check(res.events.size() == 2 && res.events[1].action == ScriptAction::Pan &&
                    near(res.events[1].number, 0.5),
                "pan fraction read");

    res = parse_event_script(R"({"events": [{"action": "seek", "time": 3, "at_ms": 500},
                                            {"action": "tick", "at_ms": 100}]})");
    ok &= check(res.status.ok && res.events.size() == 2 && res.events[1].at_ms == 500,
                "timestamps never run backwards");

    res = parse_event_script(R"([{"action": "teleport"}])");
    ok &= check(!res.status.ok && res.status.message.find("teleport") != std::string::npos,
                "unknown action named in the error");
    ok &= check(!parse_event_script(R"({"events": 3})").status.ok, "non-array refused");
    ok &= check(!parse_event_script("[{").status.ok, "syntax error reported");

    ok &= check(parse_script_action("double_click") == ScriptAction::DoubleClick &&
                    std::string(to_string(ScriptAction::InsertAfter)) == "insert_after",
                "action names");
    return ok;
}

bool test_replay(const std::string &testdata) {
    auto project = read_project(testdata + "/project.json");
    auto script = read_event_script(testdata + "/events.json");
    bool ok = check(project.status.ok && script.status.ok, "fixtures load");
    if (!ok) {
        return false;
    }
    EditorSession session(project.project.settings);
    load_into_session(project.project, session);
    auto st = replay_events(session, script.events);
    ok &= check(st.ok, "replay succeeds: " + st.message);

    const auto &store = session.store();
    ok &= check(store.size() == 3 && !store.contains("subtitle-3"), "deleted subtitle gone");
    auto greeting = store.get("subtitle-1");
    ok &= check(greeting && greeting->text == "Namaste ji", "debounced text committed");
    auto inserted = store.get("subtitle-4");
    ok &= check(inserted && near(inserted->start, 2.5) && near(inserted->end, 3.5),
                "inserted after the selection and end edited");
    auto moved = store.get("subtitle-2");
    ok &= check(moved && near(moved->start, 6.0) && near(moved->end, 8.0), "dragged by 2s");
    ok &= check(!session.interaction().dragging(), "gesture finished");
    return ok;
}

bool test_replay_errors() {
    EditorSession session;
    session.on_duration_ready(20.0);
    auto script = parse_event_script(R"([{"action": "select", "id": "ghost"}])");
    auto st = replay_events(session, script.events);
    bool ok = check(!st.ok && st.message.find("ghost") != std::string::npos,
                    "unknown selection fails the replay");

    script = parse_event_script(R"([{"action": "insert_after"}])");
    ok &= check(!replay_events(session, script.events).ok, "insert after needs a selection");

    script = parse_event_script(R"([{"action": "insert_after", "id": "ghost"}])");
    ok &= check(replay_events(session, script.events).ok && session.store().empty(),
                "insert after an unknown id creates nothing");

    script = parse_event_script(R"([{"action": "create", "start": 4, "end": 2}])");
    ok &= check(!replay_events(session, script.events).ok, "inverted create fails");

    script = parse_event_script(
        R"([{"action": "create", "start": 1, "end": 2, "text": "a"},
            {"action": "text", "text": "b", "at_ms": 10}])");
    st = replay_events(session, script.events);
    auto sel = session.selected_interval();
    ok &= check(st.ok && sel && sel->text == "b", "pending edits flushed at the end");

    // 200px track over a 15s view: x=20 is t=1.5, inside the subtitle above.
    script = parse_event_script(
        R"([{"action": "track_width", "px": 200}, {"action": "insert_after"},
            {"action": "click", "x": 20}])");
    st = replay_events(session, script.events);
    ok &= check(st.ok && session.store().size() == 2, "insert after the selection");
    ok &= check(session.selection() == sel->id, "click on the resized track selects");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: event_script_unit <TESTDATA_DIR>\n";
        return 2;
    }
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_parse();
    ok &= test_replay(argv[1]);
    ok &= test_replay_errors();
    if (ok) {
        std::cout << "event_script_unit OK\n";
    }
    return ok ? 0 : 1;
}
