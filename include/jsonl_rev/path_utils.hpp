#pragma once
#include <string_view>

namespace jr {

enum class FileFormat { JSONL, Text };

// Guess format from extension (.jsonl | .ndjson | .json); anything else is Text.
FileFormat detect_format(std::string_view path);

// MIME type reported in run stats.
std::string_view content_type(FileFormat fmt) noexcept;

}
