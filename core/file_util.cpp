#include "core/file_util.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace geneflow {

absl::StatusOr<std::string> ReadFileToString(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) return absl::NotFoundError("Could not open file: " + path);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

absl::StatusOr<size_t> WriteStringToFile(const std::string& path, const std::string& content) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) return absl::InternalError("Could not create directory " + parent.string() + ": " + ec.message());
  }
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return absl::InternalError("Could not open file for writing: " + path);
  file << content;
  file.close();
  if (file.fail()) return absl::InternalError("Failed writing file: " + path);
  return content.size();
}

}  // namespace geneflow
