// Editor session glue: debounced field edits, selection, media resync, follow mode and the
// list view.
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

#include "editor_session.hpp"
#include "logging.hpp"
#include "media_time_source.hpp"

using namespace subforge;
using std::chrono::milliseconds;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[session_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

struct FakeMedia : MediaTimeSource {
    double time = 0;
    double length = 60;
    int sets = 0;
    double current_time() const override { return time; }
    void set_current_time(double seconds) override {
        time = seconds;
        ++sets;
    }
    double duration() const override { return length; }
};

bool test_debounced_edits() {
    EditorSession session;
    session.on_duration_ready(60.0);
    auto id = session.create(1.0, 3.0, "old");
    const auto t0 = EditorSession::Clock::now();

    session.stage_text(id, "n", t0);
    session.stage_text(id, "ne", t0 + milliseconds(200));
    session.stage_text(id, "new", t0 + milliseconds(400));
    bool ok = check(session.store().get(id)->text == "old", "staged text is not committed yet");
    ok &= check(session.draft(id)->text == "new", "draft shows the latest keystroke");

    ok &= check(session.tick(t0 + milliseconds(800)) == 0, "quiet period restarts per edit");
    ok &= check(session.tick(t0 + milliseconds(900)) == 1, "one commit after 500ms quiet");
    ok &= check(session.store().get(id)->text == "new", "coalesced text committed");
    ok &= check(!session.has_pending_edits(), "nothing left pending");

    session.stage_start_text(id, "00:00:05.000", t0 + milliseconds(1000));
    auto d = session.draft(id);
    ok &= check(d && near(d->start, 5.0) && near(d->end, 7.0),
                "start field past end carries the duration in the draft");
    session.stage_end_text(id, "00:00:09.500", t0 + milliseconds(1100));
    session.flush_edits();
    auto s = session.store().get(id);
    ok &= check(s && near(s->start, 5.0) && near(s->end, 9.5), "both fields committed on flush");

    session.stage_text(id, "pending", t0 + milliseconds(1200));
    session.handle_pointer({PointerAction::Press, 700.0});
    ok &= check(session.store().get(id)->text == "pending", "a press flushes pending edits");
    session.handle_pointer({PointerAction::Release, 700.0});
    return ok;
}

bool test_selection() {
    EditorSession session;
    session.on_duration_ready(60.0);
    auto a = session.create(0.0, 2.0, "first");
    bool ok = check(session.selection() == a, "create selects");
    auto b = session.insert_after(a);
    ok &= check(b && session.selection() == *b, "insert after selects the new interval");
    auto sb = b ? session.store().get(*b) : std::nullopt;
    ok &= check(sb && near(sb->start, 2.0) && near(sb->end, 5.0), "insert after gap-fills");

    const auto t0 = EditorSession::Clock::now();
    session.stage_text(*b, "doomed", t0);
    session.remove(*b);
    ok &= check(!session.selection(), "deleting the selection clears it");
    ok &= check(!session.has_pending_edits(), "deleting drops pending edits");
    ok &= check(!session.select("subtitle-42"), "unknown ids are not selectable");

    session.select(a);
    session.remove("subtitle-42");
    ok &= check(session.selection() == a, "unrelated delete keeps the selection");

    // Drag a then delete it mid-gesture.
    session.handle_pointer({PointerAction::Press, 53.0});
    ok &= check(session.interaction().dragging(), "press on interval starts a drag");
    session.remove(a);
    ok &= check(!session.interaction().dragging(), "deleting the target ends the drag");
    session.handle_pointer({PointerAction::Move, 200.0});
    ok &= check(session.store().empty(), "stale moves do not recreate anything");
    return ok;
}

bool test_media_sync() {
    EditorSession session;
    FakeMedia media;
    session.attach_media(&media);
    bool ok = check(near(session.duration(), 60.0), "attach picks up the media duration");

    media.time = 10.2;
    session.seek(10.5);
    ok &= check(media.sets == 0, "small divergence is left alone");
    session.seek(20.0);
    ok &= check(media.sets == 1 && near(media.time, 20.0), "large divergence resyncs media");
    ok &= check(near(session.playhead(), 20.0), "seek moves the playhead");
    ok &= check(session.viewport().is_visible(20.0), "seek scrolls the playhead into view");

    session.on_time_update(40.0);
    ok &= check(media.sets == 1, "playback progress never writes back");
    ok &= check(session.viewport().is_visible(40.0), "playback follows the playhead");

    session.on_duration_ready(-1.0);
    ok &= check(near(session.duration(), 60.0), "invalid duration ignored");
    return ok;
}

bool test_click_and_list() {
    EditorConfig config;
    config.initial_view_span = 10.0;
    EditorSession session(config);
    session.on_duration_ready(60.0);
    auto late = session.create(6.0, 8.0, "Goodbye world");
    auto early = session.create(1.0, 3.0, "Hello World");
    session.clear_selection();

    // 80px per second: x=160 is t=2 inside `early`.
    session.handle_pointer({PointerAction::Press, 160.0});
    session.handle_pointer({PointerAction::Release, 160.0});
    bool ok = check(session.selection() == early, "clicking an interval selects it");

    session.handle_pointer({PointerAction::Press, 400.0});
    session.handle_pointer({PointerAction::Release, 400.0});
    ok &= check(near(session.playhead(), 5.0), "clicking empty track seeks");
    ok &= check(session.selection() == early, "seeking keeps the selection");

    session.handle_pointer({PointerAction::DoubleClick, 720.0});
    auto sel = session.selected_interval();
    ok &= check(sel && near(sel->start, 9.0) && near(sel->end, 12.0),
                "double-click creates and selects");

    auto rows = session.list("world");
    ok &= check(rows.size() == 2 && rows[0].interval.id == early && rows[0].number == 1 &&
                    rows[1].interval.id == late,
                "search is case-insensitive and time-sorted");
    rows = session.list("0:06");
    ok &= check(rows.size() == 1 && rows[0].interval.id == late, "search matches start time");
    rows = session.list();
    ok &= check(rows.size() == 3 && rows[2].selected, "selected row is flagged");

    ok &= check(session.select_from_list(late) && near(session.playhead(), 6.0),
                "list selection seeks to the start");
    auto stats = session.reading_stats(early);
    ok &= check(stats && stats->words == 2 && stats->words_per_minute == 60,
                "reading stats for a subtitle");
    return ok;
}

bool test_segmenting_key() {
    EditorSession session;
    session.on_duration_ready(30.0);
    auto a = session.create(0.0, 2.0, "one");
    session.create(6.0, 7.0, "two");
    session.clear_selection();
    bool ok = check(!session.insert_after_selection(), "segmenting key needs a selection");

    session.select(a);
    const auto t0 = EditorSession::Clock::now();
    session.stage_end_text(a, "00:00:01.500", t0);
    auto next = session.insert_after_selection();
    auto s = next ? session.store().get(*next) : std::nullopt;
    ok &= check(s && near(s->start, 1.5) && near(s->end, 4.5),
                "segment starts where the flushed selection ends");
    ok &= check(next && session.selection() == *next, "segment becomes the selection");

    next = session.insert_after_selection();
    s = next ? session.store().get(*next) : std::nullopt;
    ok &= check(s && near(s->start, 4.5) && near(s->end, 6.0), "segment clipped at next subtitle");
    ok &= check(!session.insert_after_selection(), "no room left before the next subtitle");
    return ok;
}

bool test_follow_during_drag() {
    EditorConfig config;
    config.initial_view_span = 10.0;
    EditorSession session(config);
    session.on_duration_ready(100.0);
    session.create(1.0, 3.0);

    session.handle_pointer({PointerAction::Press, 160.0});
    session.on_time_update(50.0);
    bool ok = check(near(session.viewport().view_start(), 0.0),
                    "playback does not scroll the view while dragging");
    session.handle_pointer({PointerAction::Release, 160.0});
    session.on_time_update(50.0);
    ok &= check(near(session.viewport().view_start(), 45.0), "follow resumes after the drag");
    return ok;
}

bool test_track_width() {
    EditorConfig config;
    config.initial_view_span = 10.0;
    EditorSession session(config);
    session.on_duration_ready(60.0);
    auto id = session.create(1.0, 3.0);
    session.clear_selection();

    session.handle_pointer({PointerAction::Press, 60.0});
    session.handle_pointer({PointerAction::Release, 60.0});
    bool ok = check(!session.selection(), "x=60 on an 800px track is before the subtitle");

    session.set_track_width(400.0);
    session.set_track_width(0.0);
    session.handle_pointer({PointerAction::Press, 60.0});
    session.handle_pointer({PointerAction::Release, 60.0});
    ok &= check(session.selection() == id, "after resizing to 400px x=60 hits the subtitle");
    ok &= check(near(session.config().track_width_px, 400.0), "zero width ignored");
    return ok;
}

bool test_export() {
    EditorSession session;
    session.set_media_name("/videos/lecture.mp4");
    session.set_language("ta");
    auto res = session.export_as(ExportFormat::Srt);
    bool ok = check(!res.status.ok, "empty session cannot export");

    auto id = session.create(0.0, 1.5, "");
    session.stage_text(id, "Vanakkam", EditorSession::Clock::now());
    res = session.export_as(ExportFormat::PlainText);
    ok &= check(res.status.ok && res.content == "Vanakkam", "export flushes pending edits");
    ok &= check(session.export_file_name(ExportFormat::WebVtt) == "lecture-ta.vtt",
                "export file name");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_debounced_edits();
    ok &= test_selection();
    ok &= test_media_sync();
    ok &= test_click_and_list();
    ok &= test_segmenting_key();
    ok &= test_follow_during_drag();
    ok &= test_track_width();
    ok &= test_export();
    if (ok) {
        std::cout << "session_unit OK\n";
    }
    return ok ? 0 : 1;
}
