#include "repo/glob.hpp"

#include <string_view>

namespace librarian::repo {

std::string GlobToRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    out += '^';
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            const bool is_double = (i + 1 < glob.size() && glob[i + 1] == '*');
            if (is_double) {
                // "**/" also matches zero directories.
                if (i + 2 < glob.size() && (glob[i + 2] == '/' || glob[i + 2] == '\\')) {
                    out += "(?:.*/)?";
                    i += 2;
                } else {
                    out += ".*";
                    i += 1;
                }
            } else {
                out += "[^/]*";
            }
            continue;
        }
        if (c == '?') {
            out += "[^/]";
            continue;
        }
        if (c == '.') {
            out += "\\.";
            continue;
        }
        if (c == '\\' || c == '/') {
            out += '/';
            continue;
        }
        if (std::string_view("()[]{}+^$|").find(c) != std::string_view::npos) {
            out += '\\';
            out += c;
            continue;
        }
        out += c;
    }
    out += '$';
    return out;
}

std::vector<std::string> ExpandBraceGlob(const std::string& pattern) {
    const auto open = pattern.find('{');
    const auto close = pattern.find('}', open == std::string::npos ? 0 : open + 1);
    if (open == std::string::npos || close == std::string::npos || close <= open + 1) {
        return {pattern};
    }
    std::vector<std::string> parts;
    const std::string inside = pattern.substr(open + 1, close - open - 1);
    std::size_t start = 0;
    while (start <= inside.size()) {
        auto comma = inside.find(',', start);
        if (comma == std::string::npos) {
            comma = inside.size();
        }
        parts.push_back(inside.substr(start, comma - start));
        start = comma + 1;
    }
    std::vector<std::string> out;
    for (const auto& part : parts) {
        // Nested or repeated groups expand on the next pass.
        for (auto& expanded : ExpandBraceGlob(pattern.substr(0, open) + part + pattern.substr(close + 1))) {
            out.push_back(std::move(expanded));
        }
    }
    return out;
}

GlobList CompileGlobs(const std::vector<std::string>& patterns) {
    RE2::Options options;
    options.set_log_errors(false);
    GlobList globs;
    for (const auto& pattern : patterns) {
        for (const auto& expanded : ExpandBraceGlob(pattern)) {
            auto re = std::make_shared<const RE2>(GlobToRegex(expanded), options);
            if (re->ok()) {
                globs.push_back(std::move(re));
            }
        }
    }
    return globs;
}

bool MatchAnyGlob(const GlobList& globs, std::string rel) {
    for (auto& ch : rel) {
        if (ch == '\\') {
            ch = '/';
        }
    }
    for (const auto& re : globs) {
        if (RE2::FullMatch(rel, *re)) {
            return true;
        }
    }
    return false;
}

std::string EffectivePattern(const std::string& pattern, bool recursive) {
    if (recursive && pattern.find('/') == std::string::npos &&
        pattern.find("**") == std::string::npos) {
        return "**/" + pattern;
    }
    return pattern;
}

}  // namespace librarian::repo
