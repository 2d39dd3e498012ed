#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace librarian::repo {

struct ListArgs {
    std::string directory_path = ".";
    bool include_hidden = false;
    bool recursive = false;
    int max_depth = 1;
};

struct ViewArgs {
    std::string file_path;
    // 1-indexed, inclusive; second == -1 reads to end of file.
    std::optional<std::pair<int, int>> view_range;
};

struct FindArgs {
    std::string search_path = ".";
    std::vector<std::string> patterns;
    std::vector<std::string> exclude;
    bool recursive = true;
    int max_results = 100;
    bool include_hidden = false;
};

struct GrepArgs {
    std::string search_path = ".";
    std::string query;
    std::vector<std::string> patterns{"*"};
    bool case_sensitive = false;
    bool regex = false;
    bool recursive = true;
    int max_results = 100;
    int context_before = 0;
    int context_after = 0;
    std::vector<std::string> exclude;
    bool include_hidden = false;
};

// Read-only file operations over already-resolved absolute paths. Paths in
// the output are rendered relative to the root the tools were built for.
// Implementations may throw; callers convert exceptions to payloads.
class FileTools {
public:
    virtual ~FileTools() = default;
    virtual std::string List(const std::filesystem::path& directory, const ListArgs& args) = 0;
    virtual std::string View(const std::filesystem::path& file, const ViewArgs& args) = 0;
    // Array of root-relative paths, or a "No files found" string.
    virtual nlohmann::json Find(const std::filesystem::path& directory, const FindArgs& args) = 0;
    virtual std::string Grep(const std::filesystem::path& directory, const GrepArgs& args) = 0;
};

}  // namespace librarian::repo
