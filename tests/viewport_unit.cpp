// Viewport mapping, zoom/pan clamping and the auto-scroll follow rule.
#include <cmath>
#include <iostream>
#include <string>

#include "auto_scroll.hpp"
#include "logging.hpp"
#include "viewport.hpp"

using namespace subforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[viewport_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

bool test_mapping() {
    Viewport v(10.0, 30.0);
    v.set_view_start(20.0);
    bool ok = check(near(v.time_at(0.5), 25.0), "time_at midpoint");
    ok &= check(near(v.coordinate_of(25.0), 0.5), "coordinate_of inverts time_at");
    ok &= check(near(v.pixel_of(25.0, 800.0), 400.0), "pixel_of");
    ok &= check(near(v.time_at_pixel(400.0, 800.0), 25.0), "time_at_pixel");
    ok &= check(v.is_visible(20.0) && v.is_visible(30.0) && !v.is_visible(19.9),
                "visibility is inclusive of both edges");
    return ok;
}

bool test_zoom() {
    Viewport v(15.0);
    v.set_total_duration(60.0);
    v.zoom_in();
    bool ok = check(near(v.view_span(), 7.5), "zoom in halves the span");
    for (int i = 0; i < 5; ++i) {
        v.zoom_in();
    }
    ok &= check(near(v.view_span(), Viewport::kMinSpan), "zoom in stops at 1s");
    v.zoom_out();
    ok &= check(near(v.view_span(), 2.0), "zoom out doubles the span");

    v.set_view_start(50.0);
    for (int i = 0; i < 8; ++i) {
        v.zoom_out();
    }
    ok &= check(near(v.view_span(), 60.0), "zoom out caps at the media duration");
    ok &= check(near(v.view_start(), 0.0), "full view starts at 0");

    Viewport unknown(15.0);
    unknown.zoom_out();
    ok &= check(near(unknown.view_span(), 30.0), "no upper cap while duration is unknown");

    Viewport tiny(15.0, 0.5);
    ok &= check(near(tiny.view_span(), Viewport::kMinSpan), "media under 1s keeps the 1s floor");
    return ok;
}

bool test_pan() {
    Viewport v(10.0, 30.0);
    v.pan_by(0.5);
    bool ok = check(near(v.view_start(), 5.0), "pan by half a span");
    v.pan_by(10.0);
    ok &= check(near(v.view_start(), 20.0), "pan clamps at duration - span");
    v.pan_by(-10.0);
    ok &= check(near(v.view_start(), 0.0), "pan clamps at 0");

    v.recenter_on(2.0);
    ok &= check(near(v.view_start(), 0.0), "recenter near 0 clamps");
    v.recenter_on(50.0);
    ok &= check(near(v.view_start(), 45.0), "recenter has no upper clamp");
    return ok;
}

bool test_ticks() {
    Viewport v(15.0, 60.0);
    auto ticks = v.tick_marks();
    bool ok = check(ticks.size() == 16 && near(ticks[1] - ticks[0], 1.0), "1s ticks at 15s span");
    Viewport fine(4.0, 60.0);
    ticks = fine.tick_marks();
    ok &= check(ticks.size() == 9 && near(ticks[1] - ticks[0], 0.5), "0.5s ticks at 4s span");
    Viewport coarse(30.0, 60.0);
    coarse.set_view_start(12.0);
    ticks = coarse.tick_marks();
    ok &= check(!ticks.empty() && near(ticks.front(), 15.0) && near(ticks.back(), 40.0),
                "5s ticks stay inside the view");
    return ok;
}

bool test_auto_scroll() {
    Viewport v(10.0, 100.0);
    AutoScrollController follow;
    bool ok = check(!follow.on_playhead(v, 5.0, false), "visible playhead leaves view alone");
    ok &= check(!follow.on_playhead(v, 40.0, true), "no recenter while dragging");
    ok &= check(near(v.view_start(), 0.0), "drag suppression keeps view start");
    ok &= check(follow.on_playhead(v, 40.0, false), "playhead outside recenters");
    ok &= check(near(v.view_start(), 35.0), "playhead ends up in the middle");

    AutoScrollController off(false);
    ok &= check(!off.on_playhead(v, 90.0, false), "disabled follow never scrolls");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_mapping();
    ok &= test_zoom();
    ok &= test_pan();
    ok &= test_ticks();
    ok &= test_auto_scroll();
    if (ok) {
        std::cout << "viewport_unit OK\n";
    }
    return ok ? 0 : 1;
}
