//
//  editor_session.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "editor_session.hpp"

#include <algorithm>
#include <cmath>

#include "gap_fill.hpp"
#include "languages.hpp"
#include "logging.hpp"
#include "subtitle_timing.hpp"

namespace subforge {

EditorSession::EditorSession(EditorConfig config)
    : config_(config),
      viewport_(config_.initial_view_span),
      interaction_(store_, viewport_, config_),
      auto_scroll_(config_.follow_playhead),
      debouncer_(config_.autosave_delay),
      language_(kDefaultLanguage) {
    InteractionCallbacks callbacks;
    callbacks.on_seek = [this](double t) { seek(t); };
    callbacks.on_select = [this](const IntervalId &id) { select(id); };
    callbacks.on_create = [this](const IntervalId &id) { select(id); };
    interaction_.set_callbacks(std::move(callbacks));
}

void EditorSession::attach_media(MediaTimeSource *media) {
    media_ = media;
    if (media_) {
        const double d = media_->duration();
        if (std::isfinite(d) && d > 0.0) {
            on_duration_ready(d);
        }
    }
}

void EditorSession::on_duration_ready(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        SF_LOG("warn", "ignoring media duration " << seconds);
        return;
    }
    viewport_.set_total_duration(seconds);
    SF_LOG("info", "media duration " << seconds_str(seconds));
}

void EditorSession::on_time_update(double seconds) {
    if (!std::isfinite(seconds)) {
        return;
    }
    playhead_ = std::max(0.0, seconds);
    follow(playhead_);
}

void EditorSession::seek(double seconds) {
    if (!std::isfinite(seconds)) {
        return;
    }
    playhead_ = std::max(0.0, seconds);
    if (media_ && std::abs(media_->current_time() - playhead_) > config_.resync_threshold) {
        SF_LOG("media", "resync media " << seconds_str(media_->current_time()) << " -> "
                                        << seconds_str(playhead_));
        media_->set_current_time(playhead_);
    }
    follow(playhead_);
}

void EditorSession::follow(double time) {
    auto_scroll_.on_playhead(viewport_, time, interaction_.dragging());
}

void EditorSession::handle_pointer(const PointerEvent &event) {
    if (event.action == PointerAction::Press) {
        // Field edits land before the pointer starts changing the same intervals.
        flush_edits();
    }
    interaction_.handle(event);
}

void EditorSession::set_track_width(double px) {
    if (!(px > 0.0)) {
        SF_LOG("warn", "ignoring track width " << px);
        return;
    }
    config_.track_width_px = px;
}

IntervalId EditorSession::create(double start, double end, std::string text) {
    IntervalId id = store_.create(start, end, std::move(text));
    select(id);
    return id;
}

std::optional<IntervalId> EditorSession::insert_after(const IntervalId &anchor) {
    flush_edits();
    auto id = gap_fill_after(store_, anchor, duration(), config_.default_duration);
    if (id) {
        select(*id);
    }
    return id;
}

std::optional<IntervalId> EditorSession::insert_after_selection() {
    if (!selection_) {
        return std::nullopt;
    }
    return insert_after(*selection_);
}

void EditorSession::remove(const IntervalId &id) {
    if (interaction_.drag_target() == id) {
        interaction_.abort_gesture();
    }
    debouncer_.cancel(id);
    store_.remove(id);
    if (selection_ && *selection_ == id) {
        selection_.reset();
    }
}

bool EditorSession::select(const IntervalId &id) {
    if (!store_.contains(id)) {
        SF_LOG("warn", "cannot select unknown subtitle " << id);
        return false;
    }
    selection_ = id;
    return true;
}

bool EditorSession::select_from_list(const IntervalId &id) {
    if (!select(id)) {
        return false;
    }
    if (auto interval = store_.get(id)) {
        seek(interval->start);
    }
    return true;
}

std::optional<SubtitleInterval> EditorSession::selected_interval() const {
    if (!selection_) {
        return std::nullopt;
    }
    return store_.get(*selection_);
}

std::optional<SubtitleInterval> EditorSession::draft(const IntervalId &id) const {
    auto interval = store_.get(id);
    if (!interval) {
        return std::nullopt;
    }
    if (auto pending = debouncer_.pending_patch(id)) {
        apply_patch(*interval, *pending);
    }
    return interval;
}

void EditorSession::stage(const IntervalId &id, const IntervalPatch &patch,
                          Clock::time_point now) {
    auto current = draft(id);
    if (!current) {
        SF_LOG("warn", "edit of unknown subtitle " << id);
        return;
    }
    apply_patch(*current, patch);
    // The draft already carries the corrections; stage all of it so the commit is exact.
    IntervalPatch full;
    full.start = current->start;
    full.end = current->end;
    full.text = current->text;
    debouncer_.stage(id, full, now);
}

void EditorSession::stage_text(const IntervalId &id, std::string text, Clock::time_point now) {
    IntervalPatch patch;
    patch.text = std::move(text);
    stage(id, patch, now);
}

void EditorSession::stage_start_text(const IntervalId &id, std::string_view value,
                                     Clock::time_point now) {
    IntervalPatch patch;
    patch.start = parse_time_text(value);
    stage(id, patch, now);
}

void EditorSession::stage_end_text(const IntervalId &id, std::string_view value,
                                   Clock::time_point now) {
    IntervalPatch patch;
    patch.end = parse_time_text(value);
    stage(id, patch, now);
}

void EditorSession::commit(const IntervalId &id, const IntervalPatch &patch) {
    if (!store_.update(id, patch)) {
        SF_LOG("warn", "dropped edit for " << id);
    }
}

size_t EditorSession::tick(Clock::time_point now) {
    return debouncer_.poll(now, [this](const IntervalId &id, const IntervalPatch &patch) {
        commit(id, patch);
    });
}

size_t EditorSession::flush_edits() {
    return debouncer_.flush_all([this](const IntervalId &id, const IntervalPatch &patch) {
        commit(id, patch);
    });
}

std::vector<ListEntry> EditorSession::list(std::string_view term) const {
    return project_list(store_, term, selection_);
}

std::optional<ReadingStats> EditorSession::reading_stats(const IntervalId &id) const {
    auto interval = draft(id);
    if (!interval) {
        return std::nullopt;
    }
    return compute_reading_stats(*interval);
}

ExportResult EditorSession::export_as(ExportFormat format) {
    flush_edits();
    return export_subtitles(store_.all(), format);
}

std::string EditorSession::export_file_name(ExportFormat format) const {
    return subforge::export_file_name(media_name_, language_, format);
}

}  // namespace subforge
