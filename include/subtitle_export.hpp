//
//  subtitle_export.hpp
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

#include "status.hpp"
#include "subtitle_interval.hpp"

namespace subforge {

enum class ExportFormat { Srt, WebVtt, PlainText, PlainTextTimed };

// "srt", "vtt", "txt", "txt-time".
std::optional<ExportFormat> parse_export_format(std::string_view name);
const char *format_name(ExportFormat format);
const char *file_extension(ExportFormat format);

// Each writer sorts its input by start (stable) before formatting.
std::string to_srt(std::vector<SubtitleInterval> intervals);
std::string to_webvtt(std::vector<SubtitleInterval> intervals);
std::string to_plain_text(std::vector<SubtitleInterval> intervals);
std::string to_plain_text_timed(std::vector<SubtitleInterval> intervals);

struct ExportResult {
    Status status;
    std::string content;
};

// Refuses an empty collection instead of producing an empty file.
ExportResult export_subtitles(const std::vector<SubtitleInterval> &intervals,
                              ExportFormat format);

// "<media stem>-<lang>.<ext>", or "subtitles-<lang>.<ext>" without a media name.
std::string export_file_name(const std::string &media_name, const std::string &language,
                             ExportFormat format);

// Write export content to disk.
Status write_export(const std::string &path, const std::string &content);

}  // namespace subforge
