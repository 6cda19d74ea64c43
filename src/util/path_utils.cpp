#include "jsonl_rev/path_utils.hpp"
#include <cctype>
#include <filesystem>
#include <string>

namespace jr {

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".jsonl" || ext == ".ndjson" || ext == ".json") return FileFormat::JSONL;
  return FileFormat::Text;
}

std::string_view content_type(FileFormat fmt) noexcept {
  return fmt == FileFormat::JSONL ? "application/x-ndjson" : "text/plain";
}

}
