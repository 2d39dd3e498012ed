#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "repo/file_tools.hpp"

namespace librarian::repo {

bool IsTextFile(const std::filesystem::path& path);

class LocalFileTools : public FileTools {
public:
    explicit LocalFileTools(std::filesystem::path canonical_root,
                            std::uintmax_t max_view_bytes = 1024 * 1024);

    std::string List(const std::filesystem::path& directory, const ListArgs& args) override;
    std::string View(const std::filesystem::path& file, const ViewArgs& args) override;
    nlohmann::json Find(const std::filesystem::path& directory, const FindArgs& args) override;
    std::string Grep(const std::filesystem::path& directory, const GrepArgs& args) override;

private:
    std::filesystem::path root_;
    std::uintmax_t max_view_bytes_;
};

}  // namespace librarian::repo
