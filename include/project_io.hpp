//
//  project_io.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "editor_config.hpp"
#include "editor_session.hpp"
#include "languages.hpp"
#include "status.hpp"
#include "subtitle_interval.hpp"

namespace subforge {

/**
 * @brief In-memory form of a project file.
 *
 * JSON layout:
 * @code
 * {
 *   "media": "talk.mp4",
 *   "duration": 120.5,
 *   "language": "hi",
 *   "settings": { "default_duration": 3, "track_width_px": 800, ... },
 *   "subtitles": [ { "id": "subtitle-1", "start": 0.0, "end": 2.5, "text": "Hello" } ]
 * }
 * @endcode
 * Every key is optional; missing settings keep their defaults.
 */
struct Project {
    std::string media;
    double duration = 0;
    std::string language = kDefaultLanguage;
    EditorConfig settings;
    std::vector<SubtitleInterval> subtitles;
};

struct ProjectReadResult {
    Status status;
    Project project;
};

ProjectReadResult read_project(const std::string &path);
Status write_project(const std::string &path, const Project &project);

// Populate a fresh session from a project (duration, language, media name, intervals).
// Intervals without an id get a generated one; invalid ones are skipped with a warning.
void load_into_session(const Project &project, EditorSession &session);

// Capture a session as a project; pending field edits are not included.
Project snapshot_session(const EditorSession &session);

}  // namespace subforge

#ifdef SUBFORGE_TESTING
namespace subforge::testing {
// Parse project JSON from memory.
ProjectReadResult parse_project_for_test(const std::string &json_text);
std::string serialize_project_for_test(const Project &project);
}  // namespace subforge::testing
#endif
