#include "source.hpp"

#include <fstream>
#include <utility>

namespace forge {

FileId SourceManager::add_file(std::string path) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{.id = id, .path = std::move(path)});
    by_path_.insert({files_.back().path, id});
    return id;
}

FileId SourceManager::add_buffer(std::string name, std::string text) {
    // Buffers are never deduplicated by name: two test snippets may share a
    // display name but not contents.
    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{
        .id = id, .path = std::move(name), .text = std::move(text)});
    by_path_.try_emplace(files_.back().path, id);
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

static std::optional<std::string> nth_line(std::string_view text, std::uint32_t line) {
    size_t start = 0;
    for (std::uint32_t l = 1; l < line; ++l) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) return std::nullopt;
        start = nl + 1;
    }
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    if (end > start && text[end - 1] == '\r') end--;
    return std::string(text.substr(start, end - start));
}

std::optional<std::string> SourceManager::line_text(FileId id, std::uint32_t line) const {
    if (line == 0 || static_cast<size_t>(id) >= files_.size()) return std::nullopt;
    const SourceFile& f = files_[id];
    if (f.text) return nth_line(*f.text, line);

    std::ifstream in(f.path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string text;
    for (std::uint32_t l = 1; std::getline(in, text); ++l) {
        if (l == line) {
            if (!text.empty() && text.back() == '\r') text.pop_back();
            return text;
        }
    }
    return std::nullopt;
}

}  // namespace forge
