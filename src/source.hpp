#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace forge {

using FileId = std::uint32_t;

struct SourceFile {
  FileId id = 0;
  std::string path{};
  // Set for in-memory buffers; on-disk files are read by the lexer.
  std::optional<std::string> text{};
};

class SourceManager {
 public:
  FileId add_file(std::string path);
  FileId add_buffer(std::string name, std::string text);
  std::optional<FileId> find_file(std::string_view path) const;

  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;
  // Text of the 1-based `line`, without its newline. Buffers are read from
  // memory, other files from disk.
  std::optional<std::string> line_text(FileId id, std::uint32_t line) const;
  size_t size() const { return files_.size(); }

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace forge
