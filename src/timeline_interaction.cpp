//
//  timeline_interaction.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "timeline_interaction.hpp"

#include <algorithm>
#include <cmath>

#include "gap_fill.hpp"
#include "logging.hpp"

namespace subforge {

TimelineInteraction::TimelineInteraction(IntervalStore &store, Viewport &viewport,
                                         const EditorConfig &config)
    : store_(store), viewport_(viewport), config_(config) {}

std::optional<IntervalId> TimelineInteraction::drag_target() const {
    if (!gesture_) {
        return std::nullopt;
    }
    return gesture_->id;
}

void TimelineInteraction::handle(const PointerEvent &event) {
    if (!std::isfinite(event.x)) {
        SF_LOG("warn", "dropping pointer event with non-finite position");
        return;
    }
    switch (event.action) {
        case PointerAction::Press:
            on_press(event.x);
            break;
        case PointerAction::Move:
            on_move(event.x);
            break;
        case PointerAction::Release:
            on_release(event.x, false);
            break;
        case PointerAction::Cancel:
            on_release(event.x, true);
            break;
        case PointerAction::DoubleClick:
            on_double_click(event.x);
            break;
    }
}

void TimelineInteraction::abort_gesture() {
    empty_press_x_.reset();
    end_gesture("aborted");
}

HitResult TimelineInteraction::hit_test(double x) const {
    const double width = track_width();
    const double handle = config_.handle_width_px;
    const auto intervals = store_.in_creation_order();
    // Newest first, so the most recently created interval wins on overlap.
    for (auto it = intervals.rbegin(); it != intervals.rend(); ++it) {
        const double left = viewport_.pixel_of(it->start, width);
        const double right = viewport_.pixel_of(it->end, width);
        if (x < left || x > right) {
            continue;
        }
        HitResult hit;
        hit.id = it->id;
        const double to_left = x - left;
        const double to_right = right - x;
        if (to_left <= handle || to_right <= handle) {
            hit.zone = to_left <= to_right ? HitZone::LeftHandle : HitZone::RightHandle;
        } else {
            hit.zone = HitZone::Body;
        }
        return hit;
    }
    return {};
}

void TimelineInteraction::on_press(double x) {
    if (gesture_) {
        // Missed release; the new press starts over.
        end_gesture("superseded by press");
    }
    empty_press_x_.reset();

    const HitResult hit = hit_test(x);
    if (!hit.hit()) {
        empty_press_x_ = x;
        return;
    }
    auto interval = store_.get(hit.id);
    if (!interval) {
        return;
    }

    DragState state = DragState::DraggingMove;
    if (hit.zone == HitZone::LeftHandle) {
        state = DragState::DraggingResizeLeft;
    } else if (hit.zone == HitZone::RightHandle) {
        state = DragState::DraggingResizeRight;
    }
    gesture_.emplace(Gesture{state,
                             interval->id,
                             x,
                             viewport_.time_at_pixel(x, track_width()),
                             interval->start,
                             interval->end,
                             interval->duration(),
                             false,
                             DragCapture(capture_host_)});
    SF_LOG("drag", "press " << to_string(state) << " on " << interval->id << " at "
                            << seconds_str(gesture_->press_time));
}

void TimelineInteraction::on_move(double x) {
    if (empty_press_x_ && std::abs(x - *empty_press_x_) > config_.click_slop_px) {
        empty_press_x_.reset();
    }
    if (!gesture_) {
        return;
    }
    if (!gesture_->moved) {
        if (std::abs(x - gesture_->press_x) <= config_.click_slop_px) {
            return;
        }
        gesture_->moved = true;
    }
    apply_drag(x);
}

void TimelineInteraction::apply_drag(double x) {
    auto current = store_.get(gesture_->id);
    if (!current) {
        SF_LOG("warn", "dragged subtitle " << gesture_->id << " vanished");
        end_gesture("target removed");
        return;
    }
    // Deltas use the viewport as it is now; panning mid-drag is not compensated.
    const double delta = viewport_.time_at_pixel(x, track_width()) - gesture_->press_time;

    IntervalPatch patch;
    switch (gesture_->state) {
        case DragState::DraggingMove: {
            const double start = std::max(0.0, gesture_->anchor_start + delta);
            patch.start = start;
            patch.end = start + gesture_->original_duration;
            break;
        }
        case DragState::DraggingResizeLeft: {
            const double upper = std::max(0.0, current->end - kMinIntervalDuration);
            patch.start = std::clamp(gesture_->anchor_start + delta, 0.0, upper);
            break;
        }
        case DragState::DraggingResizeRight:
            patch.end =
                std::max(current->start + kMinIntervalDuration, gesture_->anchor_end + delta);
            break;
        case DragState::Idle:
            return;
    }
    store_.update(gesture_->id, patch);
}

void TimelineInteraction::on_release(double x, bool cancelled) {
    if (gesture_) {
        const bool click = !cancelled && !gesture_->moved;
        const IntervalId id = gesture_->id;
        end_gesture(cancelled ? "cancel" : "release");
        if (click) {
            SF_LOG("drag", "click selects " << id);
            if (callbacks_.on_select) {
                callbacks_.on_select(id);
            }
        }
        return;
    }
    if (!empty_press_x_) {
        return;
    }
    const double press_x = *empty_press_x_;
    empty_press_x_.reset();
    if (cancelled || std::abs(x - press_x) > config_.click_slop_px) {
        return;
    }
    double t = std::max(0.0, viewport_.time_at_pixel(press_x, track_width()));
    if (viewport_.total_duration() > 0.0) {
        // The view may extend past the media end after a recenter.
        t = std::min(t, viewport_.total_duration());
    }
    SF_LOG("drag", "click on empty track seeks to " << seconds_str(t));
    if (callbacks_.on_seek) {
        callbacks_.on_seek(t);
    }
}

void TimelineInteraction::on_double_click(double x) {
    if (gesture_) {
        return;
    }
    const HitResult hit = hit_test(x);
    if (hit.hit()) {
        SF_LOG("drag", "double-click on " << hit.id << " ignored");
        return;
    }
    const double t = std::max(0.0, viewport_.time_at_pixel(x, track_width()));
    auto id = gap_fill_at(store_, t, viewport_.total_duration(), config_.default_duration);
    if (!id) {
        SF_LOG("drag", "double-click at " << seconds_str(t) << " found no room");
        return;
    }
    if (callbacks_.on_create) {
        callbacks_.on_create(*id);
    }
}

void TimelineInteraction::end_gesture(const char *reason) {
    if (!gesture_) {
        return;
    }
    SF_LOG("drag", "end " << to_string(gesture_->state) << " on " << gesture_->id << " ("
                          << reason << ")");
    // Destroying the gesture releases its capture.
    gesture_.reset();
}

const char *to_string(DragState state) {
    switch (state) {
        case DragState::Idle:
            return "idle";
        case DragState::DraggingMove:
            return "move";
        case DragState::DraggingResizeLeft:
            return "resize-left";
        case DragState::DraggingResizeRight:
            return "resize-right";
    }
    return "unknown";
}

}  // namespace subforge
