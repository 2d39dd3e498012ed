#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace librarian::repo {

struct TreeEntry {
    std::string name;
    bool is_directory = false;
    int depth = 0;
    std::optional<std::size_t> line_count;
    std::optional<std::uintmax_t> size;
};

struct SearchMatch {
    int line = 0;
    int column = 0;
    std::string text;
    std::vector<std::string> before;
    std::vector<std::string> after;
};

struct FileMatches {
    std::string path;
    std::vector<SearchMatch> matches;
};

std::string WithLineNumbers(const std::vector<std::string>& lines, int start_line = 1);
std::string FormatLinesWithRange(const std::vector<std::string>& lines,
                                 const std::optional<std::pair<int, int>>& range);
std::string FormatDirectoryTree(const std::vector<TreeEntry>& entries);
std::string FormatSearchResults(const std::vector<FileMatches>& results);

}  // namespace librarian::repo
