//
//  subforge.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "status.hpp"
#include "subtitle_export.hpp"
#include "subtitle_list.hpp"

namespace subforge {

/// @defgroup api SubForge Public API
/// File-driven entry points used by the command line tool.
/// @{

/**
 * @brief Return the SubForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Export the subtitles of a project file.
 *
 * When `output_path` is empty the file is written next to the project, named after the
 * project's media and language (e.g. `talk-hi.srt`). `written_path` receives the final path.
 */
Status export_project(const std::string &project_path, ExportFormat format,
                      const std::string &output_path,
                      std::string *written_path = nullptr);  ///< @ingroup api

/**
 * @brief Replay recorded editor events against a project and save the result.
 *
 * The project's settings configure the session; the edited project is written to
 * `output_path` in the same JSON layout.
 */
Status replay_project(const std::string &project_path, const std::string &events_path,
                      const std::string &output_path);  ///< @ingroup api

struct ListResult {
    Status status;
    std::vector<ListEntry> entries;
};

/// List a project's subtitles in time order, optionally filtered by a search term.
ListResult list_project(const std::string &project_path,
                        const std::string &term = {});  ///< @ingroup api

/// @}

}  // namespace subforge
