//
//  main.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "logging.hpp"
#include "subforge.hpp"
#include "subforge_version.hpp"
#include "subtitle_timing.hpp"

namespace {

void print_usage() {
    std::cerr << "SubForge " << SUBFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage for exporting:\n"
              << "  subforge <project.json> --export srt|vtt|txt|txt-time [--out PATH] "
              << "[--log-level warn|info|debug]\n"
              << "usage for listing:\n"
              << "  subforge <project.json> --list [TERM] [--log-level warn|info|debug]\n"
              << "usage for replaying edits:\n"
              << "  subforge <project.json> <events.json> <output.json> "
              << "[--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  --export FORMAT     Write subtitles as srt, vtt, txt or txt-time.\n"
              << "  --out PATH          Export destination (default: <media>-<lang>.<ext>\n"
              << "                      next to the project).\n"
              << "  --list [TERM]       Print subtitles as JSON, filtered by TERM.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

void emit_list(const std::vector<subforge::ListEntry> &entries) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &e : entries) {
        nlohmann::json item;
        item["number"] = e.number;
        item["id"] = e.interval.id;
        item["start"] = subforge::format_editor_time(e.interval.start);
        item["end"] = subforge::format_editor_time(e.interval.end);
        item["text"] = e.interval.text;
        list.push_back(item);
    }
    std::cout << list.dump(2) << "\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SubForge " << subforge::version_string() << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::string export_format;
    std::string out_path;
    bool list_mode = false;
    std::string search_term;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            subforge::set_log_verbosity(subforge::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (arg == "--export" && i + 1 < argc) {
            export_format = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--list") {
            list_mode = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                search_term = argv[++i];
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    // Export and list modes: one positional argument (project).
    if (positional.size() == 1) {
        const std::string project_path = positional[0];
        if (list_mode) {
            auto res = subforge::list_project(project_path, search_term);
            if (!res.status.ok) {
                SF_LOG("error", "subforge: failed to list subtitles: " << res.status.message);
                return 1;
            }
            emit_list(res.entries);
            return 0;
        }
        if (export_format.empty()) {
            std::cerr << "Missing --export FORMAT. See --help for usage.\n";
            return 2;
        }
        auto format = subforge::parse_export_format(export_format);
        if (!format) {
            std::cerr << "Unknown export format: " << export_format << "\n";
            return 2;
        }
        std::string written;
        auto status = subforge::export_project(project_path, *format, out_path, &written);
        if (!status.ok) {
            SF_LOG("error", "subforge: failed to export: " << status.message);
            return 1;
        }
        std::cout << "Wrote: " << written << "\n";
        return 0;
    }

    // Replay mode: three positional arguments.
    if (positional.size() != 3) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }
    const std::string project_path = positional[0];
    const std::string events_path = positional[1];
    const std::string output_path = positional[2];

    auto status = subforge::replay_project(project_path, events_path, output_path);
    if (!status.ok) {
        SF_LOG("error", "subforge: failed to replay events: " << status.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
