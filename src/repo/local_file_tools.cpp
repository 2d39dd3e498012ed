#include "repo/local_file_tools.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>
#include <sstream>
#include <unordered_set>

#include "repo/gitignore.hpp"
#include "repo/glob.hpp"
#include "repo/path_guard.hpp"
#include "repo/text_format.hpp"
#include "utils/common.hpp"

namespace librarian::repo {
namespace {

const std::unordered_set<std::string> kSkipDirs = {
    ".git", "node_modules", "dist", "build", "out", "target", "coverage", ".venv", "venv"};

const std::unordered_set<std::string> kTextExtensions = {
    ".txt", ".js", ".ts", ".jsx", ".tsx", ".json", ".yaml", ".yml", ".md",
    ".html", ".htm", ".css", ".scss", ".sass", ".less", ".py", ".rb", ".java",
    ".cpp", ".cc", ".c", ".h", ".hpp", ".go", ".rs", ".php", ".sql", ".xml", ".csv",
    ".toml", ".lock", ".sh", ".bash", ".zsh", ".env", ".dockerfile",
    ".gitignore", ".npmrc", ".prettierrc", ".eslintrc", ".editorconfig", ".jsonc"};

bool IsHidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("failed to open " + path.filename().string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    const auto content = ReadAll(path);
    if (content.empty()) {
        return {};
    }
    return utils::SplitLines(content);
}

std::size_t CountLines(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return 0;
    }
    std::size_t lines = 0;
    bool any = false;
    char last = '\n';
    char ch = 0;
    while (input.get(ch)) {
        any = true;
        if (ch == '\n') {
            ++lines;
        }
        last = ch;
    }
    if (any && last != '\n') {
        ++lines;
    }
    return lines;
}

// Paths handed to the ignore rules are relative to the repository root.
std::string RootRelative(const std::filesystem::path& root, const std::filesystem::path& path) {
    return path.lexically_relative(root).generic_string();
}

void ListLevel(const std::filesystem::path& root,
               const GitIgnore& ignore,
               const std::filesystem::path& directory,
               const ListArgs& args,
               int depth,
               std::vector<TreeEntry>& out) {
    std::vector<std::filesystem::directory_entry> children;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(
             directory, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!args.include_hidden && IsHidden(name)) {
            continue;
        }
        std::error_code type_ec;
        if (it->is_symlink(type_ec)) {
            continue;
        }
        const bool is_directory = it->is_directory(type_ec);
        if (!args.include_hidden && is_directory && kSkipDirs.count(name)) {
            continue;
        }
        if (ignore.ShouldIgnore(RootRelative(root, it->path()), is_directory)) {
            continue;
        }
        children.push_back(*it);
    }

    std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) {
        std::error_code a_ec;
        std::error_code b_ec;
        const bool a_dir = a.is_directory(a_ec);
        const bool b_dir = b.is_directory(b_ec);
        if (a_dir != b_dir) {
            return a_dir;
        }
        return a.path().filename().string() < b.path().filename().string();
    });

    for (const auto& child : children) {
        std::error_code type_ec;
        TreeEntry entry{};
        entry.name = child.path().filename().string();
        entry.depth = depth;
        entry.is_directory = child.is_directory(type_ec);
        if (!entry.is_directory) {
            entry.line_count = CountLines(child.path());
        }
        out.push_back(entry);
        if (entry.is_directory && args.recursive && depth + 1 < args.max_depth) {
            ListLevel(root, ignore, child.path(), args, depth + 1, out);
        }
    }
}

bool IsExcluded(const std::string& rel,
                const std::vector<std::string>& exclude,
                const GlobList& exclude_globs) {
    if (exclude.empty()) {
        return false;
    }
    if (MatchAnyGlob(exclude_globs, rel)) {
        return true;
    }
    // A bare name excludes any path segment with that name.
    for (const auto& part : std::filesystem::path(rel)) {
        if (std::find(exclude.begin(), exclude.end(), part.string()) != exclude.end()) {
            return true;
        }
    }
    return false;
}

// Regular files under `directory`, as paths relative to it, in sorted order.
std::vector<std::string> CollectFiles(const std::filesystem::path& root,
                                      const GitIgnore& ignore,
                                      const std::filesystem::path& directory,
                                      bool recursive,
                                      bool include_hidden) {
    std::vector<std::string> files;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    if (recursive) {
        std::filesystem::recursive_directory_iterator it(directory, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const auto name = it->path().filename().string();
            std::error_code type_ec;
            if (it->is_symlink(type_ec)) {
                continue;
            }
            if (it->is_directory(type_ec)) {
                if ((!include_hidden && IsHidden(name)) || kSkipDirs.count(name) ||
                    ignore.ShouldIgnore(RootRelative(root, it->path()), true)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!include_hidden && IsHidden(name)) {
                continue;
            }
            if (it->is_regular_file(type_ec) && !ignore.ShouldIgnore(RootRelative(root, it->path()), false)) {
                files.push_back(it->path().lexically_relative(directory).generic_string());
            }
        }
    } else {
        std::filesystem::directory_iterator it(directory, options, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            const auto name = it->path().filename().string();
            std::error_code type_ec;
            if (it->is_symlink(type_ec) || (!include_hidden && IsHidden(name))) {
                continue;
            }
            if (it->is_regular_file(type_ec) && !ignore.ShouldIgnore(RootRelative(root, it->path()), false)) {
                files.push_back(name);
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

// Literal or RE2 search over single lines. RE2 matching is linear in the
// line length and does not recurse.
class LineMatcher {
public:
    explicit LineMatcher(const GrepArgs& args)
        : literal_(!args.regex)
        , case_sensitive_(args.case_sensitive)
        , needle_(args.case_sensitive ? args.query : utils::ToLower(args.query)) {
        if (!literal_) {
            RE2::Options options;
            options.set_case_sensitive(args.case_sensitive);
            options.set_log_errors(false);
            regex_ = std::make_unique<RE2>(args.query, options);
        }
    }

    bool Ok() const { return literal_ || regex_->ok(); }
    std::string Error() const { return literal_ ? std::string() : regex_->error(); }

    // Byte offset of the first match, or npos.
    std::size_t Find(const std::string& line) const {
        if (literal_) {
            return case_sensitive_ ? line.find(needle_) : utils::ToLower(line).find(needle_);
        }
        re2::StringPiece match;
        if (!regex_->Match(line, 0, line.size(), RE2::UNANCHORED, &match, 1)) {
            return std::string::npos;
        }
        return match.data() ? static_cast<std::size_t>(match.data() - line.data()) : 0;
    }

private:
    bool literal_;
    bool case_sensitive_;
    std::string needle_;
    std::unique_ptr<RE2> regex_;
};

}  // namespace

bool IsTextFile(const std::filesystem::path& path) {
    const auto ext = utils::ToLower(path.extension().string());
    if (kTextExtensions.count(ext) || utils::ToLower(path.filename().string()) == "dockerfile") {
        return true;
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    char buffer[512];
    input.read(buffer, sizeof(buffer));
    const auto count = input.gcount();
    return std::find(buffer, buffer + count, '\0') == buffer + count;
}

LocalFileTools::LocalFileTools(std::filesystem::path canonical_root, std::uintmax_t max_view_bytes)
    : root_(std::move(canonical_root))
    , max_view_bytes_(max_view_bytes) {}

std::string LocalFileTools::List(const std::filesystem::path& directory, const ListArgs& args) {
    const auto rel = RelativeToRoot(root_, directory);
    std::error_code ec;
    if (!std::filesystem::exists(directory, ec)) {
        return "Error: Directory not found: " + rel;
    }
    if (!std::filesystem::is_directory(directory, ec)) {
        return "Error: Path is not a directory: " + rel;
    }

    std::vector<TreeEntry> entries;
    ListLevel(root_, GitIgnore::Load(root_), directory, args, 0, entries);

    std::ostringstream oss;
    oss << "Contents of directory: " << rel << "\n\n";
    oss << "Total entries: " << entries.size() << "\n\n";
    oss << FormatDirectoryTree(entries);
    return oss.str();
}

std::string LocalFileTools::View(const std::filesystem::path& file, const ViewArgs& args) {
    const auto rel = RelativeToRoot(root_, file);
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return "Error: File not found: " + rel;
    }
    if (std::filesystem::is_directory(file, ec)) {
        return "Error: Path is a directory, not a file: " + rel;
    }
    if (!IsTextFile(file)) {
        return "This file is not a text file and cannot be read as text. Path: " + rel;
    }
    const auto size = std::filesystem::file_size(file, ec);
    if (!ec && size > max_view_bytes_) {
        return "Error: File is too large to view (" + std::to_string(size) +
            " bytes). Use viewRange or grep to narrow it down: " + rel;
    }
    return FormatLinesWithRange(ReadLines(file), args.view_range);
}

nlohmann::json LocalFileTools::Find(const std::filesystem::path& directory, const FindArgs& args) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return "Error: Search path \"" + args.search_path + "\" is not a directory";
    }

    std::vector<std::string> effective;
    for (const auto& pattern : args.patterns) {
        effective.push_back(EffectivePattern(pattern, args.recursive));
    }
    std::vector<std::string> effective_exclude;
    for (const auto& pattern : args.exclude) {
        effective_exclude.push_back(EffectivePattern(pattern, true));
    }
    const auto globs = CompileGlobs(effective);
    const auto exclude_globs = CompileGlobs(effective_exclude);

    std::set<std::string> matched;
    const auto ignore = GitIgnore::Load(root_);
    for (const auto& rel : CollectFiles(root_, ignore, directory, args.recursive, args.include_hidden)) {
        if (!MatchAnyGlob(globs, rel) || IsExcluded(rel, args.exclude, exclude_globs)) {
            continue;
        }
        matched.insert(RelativeToRoot(root_, directory / rel));
    }

    if (matched.empty()) {
        return "No files found matching patterns: " + utils::Join(args.patterns, ", ");
    }

    nlohmann::json paths = nlohmann::json::array();
    for (const auto& path : matched) {
        if (static_cast<int>(paths.size()) >= args.max_results) {
            break;
        }
        paths.push_back(path);
    }
    return paths;
}

std::string LocalFileTools::Grep(const std::filesystem::path& directory, const GrepArgs& args) {
    if (args.query.empty()) {
        return "Error: The \"query\" parameter is required";
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return "Error: Search path \"" + args.search_path + "\" is not a directory";
    }

    const LineMatcher matcher(args);
    if (!matcher.Ok()) {
        return "Error: Invalid regex pattern: " + matcher.Error();
    }

    std::vector<std::string> effective;
    for (const auto& pattern : args.patterns) {
        effective.push_back(EffectivePattern(pattern, args.recursive));
    }
    std::vector<std::string> effective_exclude;
    for (const auto& pattern : args.exclude) {
        effective_exclude.push_back(EffectivePattern(pattern, true));
    }
    const auto globs = CompileGlobs(effective);
    const auto exclude_globs = CompileGlobs(effective_exclude);

    std::vector<FileMatches> results;
    int total = 0;
    const auto ignore = GitIgnore::Load(root_);
    for (const auto& rel : CollectFiles(root_, ignore, directory, args.recursive, args.include_hidden)) {
        if (total >= args.max_results) {
            break;
        }
        if (!MatchAnyGlob(globs, rel) || IsExcluded(rel, args.exclude, exclude_globs)) {
            continue;
        }
        const auto full = directory / rel;
        if (!IsTextFile(full)) {
            continue;
        }
        std::vector<std::string> lines;
        try {
            lines = ReadLines(full);
        } catch (const std::exception&) {
            // Unreadable files are skipped like binary ones.
            continue;
        }

        FileMatches file_matches{};
        file_matches.path = RelativeToRoot(root_, full);
        for (std::size_t i = 0; i < lines.size() && total < args.max_results; ++i) {
            const auto position = matcher.Find(lines[i]);
            if (position == std::string::npos) {
                continue;
            }
            SearchMatch entry{};
            entry.line = static_cast<int>(i) + 1;
            entry.column = static_cast<int>(position) + 1;
            entry.text = lines[i];
            const auto before_start = i >= static_cast<std::size_t>(args.context_before)
                ? i - static_cast<std::size_t>(args.context_before)
                : 0;
            entry.before.assign(lines.begin() + static_cast<long>(before_start),
                                lines.begin() + static_cast<long>(i));
            const auto after_end = std::min(lines.size(), i + 1 + static_cast<std::size_t>(args.context_after));
            entry.after.assign(lines.begin() + static_cast<long>(i + 1),
                               lines.begin() + static_cast<long>(after_end));
            file_matches.matches.push_back(std::move(entry));
            ++total;
        }
        if (!file_matches.matches.empty()) {
            results.push_back(std::move(file_matches));
        }
    }

    if (results.empty()) {
        return "No matches found for query \"" + args.query + "\" in the searched files";
    }
    return FormatSearchResults(results);
}

}  // namespace librarian::repo
