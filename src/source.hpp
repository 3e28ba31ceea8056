#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keel {

using FileId = std::uint32_t;

struct SourceFile {
  FileId id = 0;
  std::string path{};
  std::string text{};
  bool loaded = false;
};

class SourceManager {
 public:
  FileId add_file(std::string path);
  // Registers an in-memory buffer under a synthetic path.
  FileId add_buffer(std::string path, std::string text);
  std::optional<FileId> find_file(std::string_view path) const;

  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;

  // Reads the file from disk on first use. Returns nullptr if it cannot be
  // opened.
  const std::string* text(FileId id);

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace keel
