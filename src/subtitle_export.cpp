//
//  subtitle_export.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "subtitle_export.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "languages.hpp"
#include "logging.hpp"
#include "reading_stats.hpp"
#include "subtitle_timing.hpp"

namespace {

using subforge::SubtitleInterval;

void sort_by_start(std::vector<SubtitleInterval> &intervals) {
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const SubtitleInterval &a, const SubtitleInterval &b) {
                         return a.start < b.start;
                     });
}

std::string cue_range(const SubtitleInterval &s, char sep) {
    return subforge::format_timestamp(s.start, sep) + " --> " +
           subforge::format_timestamp(s.end, sep);
}

}  // namespace

namespace subforge {

std::optional<ExportFormat> parse_export_format(std::string_view name) {
    if (name == "srt") return ExportFormat::Srt;
    if (name == "vtt") return ExportFormat::WebVtt;
    if (name == "txt") return ExportFormat::PlainText;
    if (name == "txt-time") return ExportFormat::PlainTextTimed;
    return std::nullopt;
}

const char *format_name(ExportFormat format) {
    switch (format) {
        case ExportFormat::Srt:
            return "srt";
        case ExportFormat::WebVtt:
            return "vtt";
        case ExportFormat::PlainText:
            return "txt";
        case ExportFormat::PlainTextTimed:
            return "txt-time";
    }
    return "srt";
}

const char *file_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Srt:
            return "srt";
        case ExportFormat::WebVtt:
            return "vtt";
        case ExportFormat::PlainText:
        case ExportFormat::PlainTextTimed:
            return "txt";
    }
    return "txt";
}

std::string to_srt(std::vector<SubtitleInterval> intervals) {
    sort_by_start(intervals);
    std::string out;
    for (size_t i = 0; i < intervals.size(); ++i) {
        if (i > 0) {
            out += "\n";
        }
        out += std::to_string(i + 1) + "\n";
        out += cue_range(intervals[i], ',') + "\n";
        out += intervals[i].text + "\n";
    }
    return out;
}

std::string to_webvtt(std::vector<SubtitleInterval> intervals) {
    sort_by_start(intervals);
    std::string out = "WEBVTT\n\n";
    for (size_t i = 0; i < intervals.size(); ++i) {
        if (i > 0) {
            out += "\n";
        }
        out += cue_range(intervals[i], '.') + "\n";
        out += intervals[i].text + "\n";
    }
    return out;
}

std::string to_plain_text(std::vector<SubtitleInterval> intervals) {
    sort_by_start(intervals);
    std::string out;
    bool first = true;
    for (const auto &s : intervals) {
        if (subforge::is_blank(s.text)) {
            continue;
        }
        if (!first) {
            out += "\n";
        }
        out += s.text;
        first = false;
    }
    return out;
}

std::string to_plain_text_timed(std::vector<SubtitleInterval> intervals) {
    sort_by_start(intervals);
    std::string out;
    bool first = true;
    for (const auto &s : intervals) {
        if (subforge::is_blank(s.text)) {
            continue;
        }
        if (!first) {
            out += "\n\n";
        }
        out += "[" + cue_range(s, ',') + "]\n" + s.text;
        first = false;
    }
    return out;
}

ExportResult export_subtitles(const std::vector<SubtitleInterval> &intervals,
                              ExportFormat format) {
    ExportResult result;
    if (intervals.empty()) {
        result.status = make_status(false, "No subtitles to export. Create some subtitles first.");
        SF_LOG("warn", result.status.message);
        return result;
    }
    switch (format) {
        case ExportFormat::Srt:
            result.content = to_srt(intervals);
            break;
        case ExportFormat::WebVtt:
            result.content = to_webvtt(intervals);
            break;
        case ExportFormat::PlainText:
            result.content = to_plain_text(intervals);
            break;
        case ExportFormat::PlainTextTimed:
            result.content = to_plain_text_timed(intervals);
            break;
    }
    SF_LOG("export", "exported " << intervals.size() << " subtitles as " << format_name(format)
                                 << " (" << result.content.size() << " bytes)");
    result.status = make_status(true);
    return result;
}

std::string export_file_name(const std::string &media_name, const std::string &language,
                             ExportFormat format) {
    if (!find_language(language)) {
        SF_LOG("warn", "language code \"" << language << "\" is not in the language table");
    }
    const std::string ext = file_extension(format);
    std::string stem;
    if (!media_name.empty()) {
        stem = std::filesystem::path(media_name).filename().stem().string();
    }
    if (stem.empty()) {
        return "subtitles-" + language + "." + ext;
    }
    return stem + "-" + language + "." + ext;
}

Status write_export(const std::string &path, const std::string &content) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        SF_LOG("error", msg);
        return make_status(false, msg);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out.good()) {
        std::string msg = "write failed for " + path;
        SF_LOG("error", msg);
        return make_status(false, msg);
    }
    return make_status(true);
}

}  // namespace subforge
