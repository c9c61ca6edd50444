//
//  project_io.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "project_io.hpp"

#include <cerrno>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

#include "interval_store.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace {

using subforge::EditorConfig;
using subforge::Project;
using subforge::ProjectReadResult;
using subforge::SubtitleInterval;

EditorConfig settings_from_json(const json &j) {
    EditorConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.default_duration = j.value("default_duration", cfg.default_duration);
    cfg.initial_view_span = j.value("initial_view_span", cfg.initial_view_span);
    cfg.handle_width_px = j.value("handle_width_px", cfg.handle_width_px);
    cfg.click_slop_px = j.value("click_slop_px", cfg.click_slop_px);
    cfg.track_width_px = j.value("track_width_px", cfg.track_width_px);
    cfg.resync_threshold = j.value("resync_threshold", cfg.resync_threshold);
    cfg.follow_playhead = j.value("follow_playhead", cfg.follow_playhead);
    cfg.autosave_delay = std::chrono::milliseconds(
        j.value("autosave_delay_ms", static_cast<int64_t>(cfg.autosave_delay.count())));
    if (!(cfg.track_width_px > 0.0)) {
        SF_LOG("warn", "settings.track_width_px must be positive; using default");
        cfg.track_width_px = EditorConfig{}.track_width_px;
    }
    if (!(cfg.default_duration > 0.0)) {
        SF_LOG("warn", "settings.default_duration must be positive; using default");
        cfg.default_duration = EditorConfig{}.default_duration;
    }
    return cfg;
}

json settings_to_json(const EditorConfig &cfg) {
    json j;
    j["default_duration"] = cfg.default_duration;
    j["initial_view_span"] = cfg.initial_view_span;
    j["handle_width_px"] = cfg.handle_width_px;
    j["click_slop_px"] = cfg.click_slop_px;
    j["track_width_px"] = cfg.track_width_px;
    j["resync_threshold"] = cfg.resync_threshold;
    j["follow_playhead"] = cfg.follow_playhead;
    j["autosave_delay_ms"] = cfg.autosave_delay.count();
    return j;
}

Project project_from_json(const json &j) {
    Project p;
    p.media = j.value("media", "");
    p.duration = j.value("duration", 0.0);
    p.language = j.value("language", std::string(subforge::kDefaultLanguage));
    if (j.contains("settings")) {
        p.settings = settings_from_json(j["settings"]);
    }
    if (j.contains("subtitles") && j["subtitles"].is_array()) {
        p.subtitles.reserve(j["subtitles"].size());
        for (const auto &s : j["subtitles"]) {
            SubtitleInterval interval;
            interval.id = s.value("id", "");
            interval.start = s.value("start", 0.0);
            interval.end = s.value("end", 0.0);
            interval.text = s.value("text", "");
            p.subtitles.push_back(std::move(interval));
        }
    }
    return p;
}

json project_to_json(const Project &p) {
    json j;
    j["media"] = p.media;
    j["duration"] = p.duration;
    j["language"] = p.language;
    j["settings"] = settings_to_json(p.settings);
    json subtitles = json::array();
    for (const auto &s : p.subtitles) {
        json entry;
        entry["id"] = s.id;
        entry["start"] = s.start;
        entry["end"] = s.end;
        entry["text"] = s.text;
        subtitles.push_back(entry);
    }
    j["subtitles"] = subtitles;
    return j;
}

ProjectReadResult parse_project(std::istream &in, const std::string &origin) {
    ProjectReadResult res;
    try {
        json j;
        in >> j;
        if (!j.is_object()) {
            res.status = subforge::make_status(false, origin + ": project root must be an object");
            return res;
        }
        res.project = project_from_json(j);
    } catch (const json::exception &e) {
        res.status = subforge::make_status(false, origin + ": " + e.what());
        SF_LOG("error", res.status.message);
        return res;
    }
    res.status = subforge::make_status(true);
    SF_LOG("io", "read " << origin << ": subtitles=" << res.project.subtitles.size()
                         << " duration=" << res.project.duration);
    return res;
}

}  // namespace

namespace subforge {

ProjectReadResult read_project(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        ProjectReadResult res;
        res.status = make_status(false, "open failed for " + path + " (" +
                                            std::generic_category().message(errno) + ")");
        SF_LOG("error", res.status.message);
        return res;
    }
    return parse_project(f, path);
}

Status write_project(const std::string &path, const Project &project) {
    std::ofstream out(path);
    if (!out.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        SF_LOG("error", msg);
        return make_status(false, msg);
    }
    out << project_to_json(project).dump(2) << "\n";
    if (!out.good()) {
        std::string msg = "write failed for " + path;
        SF_LOG("error", msg);
        return make_status(false, msg);
    }
    return make_status(true);
}

void load_into_session(const Project &project, EditorSession &session) {
    session.set_media_name(project.media);
    session.set_language(project.language);
    if (project.duration > 0.0) {
        session.on_duration_ready(project.duration);
    }
    auto &store = session.store();
    for (const auto &s : project.subtitles) {
        if (!s.id.empty()) {
            store.restore(s);
            continue;
        }
        try {
            store.create(s.start, s.end, s.text);
        } catch (const InvalidRangeError &e) {
            SF_LOG("warn", "skipping subtitle: " << e.what());
        }
    }
}

Project snapshot_session(const EditorSession &session) {
    Project p;
    p.media = session.media_name();
    p.duration = session.duration();
    p.language = session.language();
    p.settings = session.config();
    p.subtitles = session.store().all();
    return p;
}

}  // namespace subforge

#ifdef SUBFORGE_TESTING
namespace subforge::testing {
ProjectReadResult parse_project_for_test(const std::string &json_text) {
    std::istringstream in(json_text);
    return parse_project(in, "<memory>");
}
std::string serialize_project_for_test(const Project &project) {
    return project_to_json(project).dump();
}
}  // namespace subforge::testing
#endif
