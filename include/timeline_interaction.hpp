//
//  timeline_interaction.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "drag_capture.hpp"
#include "editor_config.hpp"
#include "interval_store.hpp"
#include "subtitle_interval.hpp"
#include "viewport.hpp"

namespace subforge {

enum class DragState { Idle, DraggingMove, DraggingResizeLeft, DraggingResizeRight };

enum class PointerAction { Press, Move, Release, Cancel, DoubleClick };

// Pointer input in track pixels (0 = left edge of the timeline track).
struct PointerEvent {
    PointerAction action = PointerAction::Move;
    double x = 0;
};

enum class HitZone { None, Body, LeftHandle, RightHandle };

struct HitResult {
    IntervalId id;
    HitZone zone = HitZone::None;

    bool hit() const { return zone != HitZone::None; }
};

// Outcomes the interaction reports to its owner.
struct InteractionCallbacks {
    std::function<void(double)> on_seek;
    std::function<void(const IntervalId &)> on_select;
    std::function<void(const IntervalId &)> on_create;
};

/**
 * @brief Pointer state machine of the timeline track.
 *
 * Idle -> Dragging{Move,ResizeLeft,ResizeRight} on a press over an interval, back to Idle on
 * release or cancel. Every drag step is written straight into the store. A press+release
 * that never travelled further than the click slop is a click: it selects the interval
 * under the pointer, or requests a seek on empty track. A double-click on empty track
 * creates a gap-filled interval.
 *
 * Overlapping intervals are hit-tested most-recently-created first.
 */
class TimelineInteraction {
   public:
    TimelineInteraction(IntervalStore &store, Viewport &viewport, const EditorConfig &config);

    TimelineInteraction(const TimelineInteraction &) = delete;
    TimelineInteraction &operator=(const TimelineInteraction &) = delete;

    void set_callbacks(InteractionCallbacks callbacks) { callbacks_ = std::move(callbacks); }
    void set_capture_host(PointerCaptureHost *host) { capture_host_ = host; }

    void handle(const PointerEvent &event);

    // End a gesture that cannot continue (target deleted, host lost the pointer). Keeps the
    // last applied update and never counts as a click.
    void abort_gesture();

    DragState state() const { return gesture_ ? gesture_->state : DragState::Idle; }
    bool dragging() const { return gesture_.has_value(); }
    std::optional<IntervalId> drag_target() const;

    HitResult hit_test(double x) const;

   private:
    struct Gesture {
        DragState state = DragState::Idle;
        IntervalId id;
        double press_x = 0;
        double press_time = 0;
        double anchor_start = 0;
        double anchor_end = 0;
        double original_duration = 0;
        bool moved = false;
        DragCapture capture;
    };

    void on_press(double x);
    void on_move(double x);
    void on_release(double x, bool cancelled);
    void on_double_click(double x);
    void apply_drag(double x);
    void end_gesture(const char *reason);

    double track_width() const { return config_.track_width_px; }

    IntervalStore &store_;
    Viewport &viewport_;
    const EditorConfig &config_;
    InteractionCallbacks callbacks_;
    PointerCaptureHost *capture_host_ = nullptr;

    std::optional<Gesture> gesture_;
    std::optional<double> empty_press_x_;  // press on empty track awaiting a click
};

const char *to_string(DragState state);

}  // namespace subforge
