#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "repo/glob.hpp"

namespace librarian::repo {

// Rules from the root .gitignore, matched against root-relative paths.
// The last matching rule decides; "!" rules re-include.
class GitIgnore {
public:
    GitIgnore() = default;

    static GitIgnore Parse(const std::string& content);
    // Missing or unreadable file yields an empty rule set.
    static GitIgnore Load(const std::filesystem::path& root);

    bool ShouldIgnore(const std::string& rel, bool is_directory) const;
    bool Empty() const { return rules_.empty(); }

private:
    struct Rule {
        GlobList self;
        GlobList below;
        bool negation = false;
        bool directory_only = false;
    };

    std::vector<Rule> rules_;
};

}  // namespace librarian::repo
