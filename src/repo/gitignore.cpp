#include "repo/gitignore.hpp"

#include <fstream>
#include <sstream>

#include "utils/common.hpp"

namespace librarian::repo {

GitIgnore GitIgnore::Parse(const std::string& content) {
    GitIgnore ignore;
    for (const auto& raw : utils::SplitLines(content)) {
        auto line = utils::Trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        Rule rule{};
        if (line[0] == '!') {
            rule.negation = true;
            line = utils::Trim(line.substr(1));
        }
        if (!line.empty() && line.back() == '/') {
            rule.directory_only = true;
            line.pop_back();
        }
        if (line.empty() || line == "/") {
            continue;
        }
        if (line[0] == '/') {
            line.erase(0, 1);
        } else if (line.find('/') == std::string::npos) {
            line = "**/" + line;
        }
        rule.self = CompileGlobs({line});
        rule.below = CompileGlobs({line + "/**"});
        if (rule.self.empty()) {
            continue;
        }
        ignore.rules_.push_back(std::move(rule));
    }
    return ignore;
}

GitIgnore GitIgnore::Load(const std::filesystem::path& root) {
    std::ifstream input(root / ".gitignore", std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Parse(buffer.str());
}

bool GitIgnore::ShouldIgnore(const std::string& rel, bool is_directory) const {
    if (rel.empty() || rel == ".") {
        return false;
    }
    bool ignored = false;
    for (const auto& rule : rules_) {
        const bool matches = MatchAnyGlob(rule.below, rel) ||
            ((is_directory || !rule.directory_only) && MatchAnyGlob(rule.self, rel));
        if (matches) {
            ignored = !rule.negation;
        }
    }
    return ignored;
}

}  // namespace librarian::repo
