//
//  editor_config.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>

namespace subforge {

/**
 * @brief Tunables of an editor session.
 *
 * Defaults mirror the interactive editor; a project file may override them through its
 * `settings` object (see project_io.hpp).
 */
struct EditorConfig {
    double default_duration = 3.0;      ///< Length of gap-filled intervals (s)
    double initial_view_span = 15.0;    ///< Visible window when a session starts (s)
    double handle_width_px = 6.0;       ///< Resize handle width at either interval edge
    double click_slop_px = 3.0;         ///< Pointer travel below which a press+release is a click
    double track_width_px = 800.0;      ///< Width of the timeline track in pixels
    double resync_threshold = 0.5;      ///< Media/playhead divergence that forces a seek (s)
    bool follow_playhead = true;        ///< Auto-scroll the viewport during playback
    std::chrono::milliseconds autosave_delay{500};
};

}  // namespace subforge
