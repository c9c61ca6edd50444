//
//  editor_session.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "auto_scroll.hpp"
#include "drag_capture.hpp"
#include "edit_debouncer.hpp"
#include "editor_config.hpp"
#include "interval_store.hpp"
#include "media_time_source.hpp"
#include "reading_stats.hpp"
#include "subtitle_export.hpp"
#include "subtitle_list.hpp"
#include "timeline_interaction.hpp"
#include "viewport.hpp"

namespace subforge {

/**
 * @brief One editing session over one media file.
 *
 * Owns the interval store, the viewport and the pointer state machine, and glues them to
 * the media player, the selection and the debounced text/time fields. All calls are
 * expected from a single event loop; each runs to completion.
 *
 * The media source and capture host are borrowed and must outlive the session.
 */
class EditorSession {
   public:
    using Clock = EditDebouncer::Clock;

    explicit EditorSession(EditorConfig config = {});

    EditorSession(const EditorSession &) = delete;
    EditorSession &operator=(const EditorSession &) = delete;

    // --- collaborators --------------------------------------------------------------------
    void attach_media(MediaTimeSource *media);
    void set_capture_host(PointerCaptureHost *host) { interaction_.set_capture_host(host); }

    // --- media events ---------------------------------------------------------------------
    void on_duration_ready(double seconds);
    // Playback progress reported by the media player.
    void on_time_update(double seconds);
    // Playhead change requested by the editor (track click, list selection).
    void seek(double seconds);
    double playhead() const { return playhead_; }
    double duration() const { return viewport_.total_duration(); }

    // --- timeline -------------------------------------------------------------------------
    void handle_pointer(const PointerEvent &event);
    void zoom_in() { viewport_.zoom_in(); }
    void zoom_out() { viewport_.zoom_out(); }
    void pan_by(double fraction_of_span) { viewport_.pan_by(fraction_of_span); }
    void set_track_width(double px);

    // --- intervals ------------------------------------------------------------------------
    // Direct creation; throws InvalidRangeError when end <= start. Selects the new interval.
    IntervalId create(double start, double end, std::string text = {});
    // Gap-filled creation after `anchor` ("insert after").
    std::optional<IntervalId> insert_after(const IntervalId &anchor);
    // Segmenting key while editing text: insert after the selection.
    std::optional<IntervalId> insert_after_selection();
    void remove(const IntervalId &id);

    bool select(const IntervalId &id);
    // Selecting from the list also moves the playhead to the interval.
    bool select_from_list(const IntervalId &id);
    void clear_selection() { selection_.reset(); }
    const std::optional<IntervalId> &selection() const { return selection_; }
    std::optional<SubtitleInterval> selected_interval() const;

    // --- text/time fields -----------------------------------------------------------------
    void stage_text(const IntervalId &id, std::string text, Clock::time_point now);
    void stage_start_text(const IntervalId &id, std::string_view value, Clock::time_point now);
    void stage_end_text(const IntervalId &id, std::string_view value, Clock::time_point now);
    // Store state with any pending field edits applied.
    std::optional<SubtitleInterval> draft(const IntervalId &id) const;
    // Commit edits whose quiet period has elapsed.
    size_t tick(Clock::time_point now);
    size_t flush_edits();
    bool has_pending_edits() const { return debouncer_.pending_count() != 0; }

    // --- views ----------------------------------------------------------------------------
    std::vector<ListEntry> list(std::string_view term = {}) const;
    std::optional<ReadingStats> reading_stats(const IntervalId &id) const;

    // --- project --------------------------------------------------------------------------
    void set_media_name(std::string name) { media_name_ = std::move(name); }
    const std::string &media_name() const { return media_name_; }
    void set_language(std::string code) { language_ = std::move(code); }
    const std::string &language() const { return language_; }

    // Flushes pending edits, then formats every interval.
    ExportResult export_as(ExportFormat format);
    std::string export_file_name(ExportFormat format) const;

    IntervalStore &store() { return store_; }
    const IntervalStore &store() const { return store_; }
    Viewport &viewport() { return viewport_; }
    const Viewport &viewport() const { return viewport_; }
    const TimelineInteraction &interaction() const { return interaction_; }
    const EditorConfig &config() const { return config_; }

   private:
    void stage(const IntervalId &id, const IntervalPatch &patch, Clock::time_point now);
    void commit(const IntervalId &id, const IntervalPatch &patch);
    void follow(double time);

    EditorConfig config_;
    IntervalStore store_;
    Viewport viewport_;
    TimelineInteraction interaction_;
    AutoScrollController auto_scroll_;
    EditDebouncer debouncer_;

    MediaTimeSource *media_ = nullptr;
    double playhead_ = 0.0;
    std::optional<IntervalId> selection_;
    std::string media_name_;
    std::string language_;
};

}  // namespace subforge
