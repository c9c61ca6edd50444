//
//  subforge.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "subforge.hpp"

#include <filesystem>

#include "editor_session.hpp"
#include "event_script.hpp"
#include "logging.hpp"
#include "project_io.hpp"
#include "subforge_version.hpp"

namespace subforge {

std::string version_string() { return SUBFORGE_VERSION_DISPLAY; }

Status export_project(const std::string &project_path, ExportFormat format,
                      const std::string &output_path, std::string *written_path) {
    auto loaded = read_project(project_path);
    if (!loaded.status.ok) {
        return loaded.status;
    }
    EditorSession session(loaded.project.settings);
    load_into_session(loaded.project, session);

    auto res = session.export_as(format);
    if (!res.status.ok) {
        return res.status;
    }

    std::filesystem::path out = output_path;
    if (out.empty()) {
        out = std::filesystem::path(project_path).parent_path() /
              session.export_file_name(format);
    }
    auto st = write_export(out.string(), res.content);
    if (!st.ok) {
        return st;
    }
    SF_LOG("info", "exported " << session.store().size() << " subtitles as "
                               << format_name(format) << " to " << out.string());
    if (written_path) {
        *written_path = out.string();
    }
    return make_status(true);
}

Status replay_project(const std::string &project_path, const std::string &events_path,
                      const std::string &output_path) {
    auto loaded = read_project(project_path);
    if (!loaded.status.ok) {
        return loaded.status;
    }
    auto script = read_event_script(events_path);
    if (!script.status.ok) {
        return script.status;
    }

    EditorSession session(loaded.project.settings);
    load_into_session(loaded.project, session);

    auto st = replay_events(session, script.events);
    if (!st.ok) {
        return st;
    }

    Project edited = snapshot_session(session);
    return write_project(output_path, edited);
}

ListResult list_project(const std::string &project_path, const std::string &term) {
    ListResult res;
    auto loaded = read_project(project_path);
    if (!loaded.status.ok) {
        res.status = loaded.status;
        return res;
    }
    EditorSession session(loaded.project.settings);
    load_into_session(loaded.project, session);
    res.entries = session.list(term);
    res.status = make_status(true);
    return res;
}

}  // namespace subforge
