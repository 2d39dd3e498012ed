#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "repo/file_tools.hpp"
#include "utils/logging.hpp"

namespace librarian::repo {

// The four read-only repository operations exposed to scripts, bound to one
// root for their whole lifetime. Every call yields a payload: a string, or a
// JSON array of paths for a successful find. Nothing escapes as an exception.
class RepoApi {
public:
    RepoApi(const std::filesystem::path& root,
            std::shared_ptr<FileTools> tools,
            std::shared_ptr<utils::LogSink> sink);

    // Builds a RepoApi backed by LocalFileTools. Throws when root is not a directory.
    static std::shared_ptr<RepoApi> ForDirectory(const std::filesystem::path& root,
                                                 std::shared_ptr<utils::LogSink> sink);

    nlohmann::json List(const nlohmann::json& args) const;
    nlohmann::json View(const nlohmann::json& args) const;
    nlohmann::json Find(const nlohmann::json& args) const;
    nlohmann::json Grep(const nlohmann::json& args) const;

    // Dispatches by operation name ("list", "view", "find", "grep").
    nlohmann::json Call(const std::string& operation, const nlohmann::json& args) const;

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path root_;
    std::shared_ptr<FileTools> tools_;
    std::shared_ptr<utils::LogSink> sink_;
};

}  // namespace librarian::repo
