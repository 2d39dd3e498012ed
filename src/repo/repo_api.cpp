#include "repo/repo_api.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include "repo/local_file_tools.hpp"
#include "repo/path_guard.hpp"

namespace librarian::repo {
namespace {

// Integral JSON numbers that fit in an int; anything else is rejected.
std::optional<int> ToInt(const nlohmann::json& value) {
    if (!value.is_number()) {
        return std::nullopt;
    }
    const auto number = value.get<double>();
    if (!std::isfinite(number) || std::trunc(number) != number ||
        number < static_cast<double>(std::numeric_limits<int>::min()) ||
        number > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(number);
}

// Reads optional, typed fields from a script-supplied argument record.
// The first type mismatch is kept in error() and later reads are skipped.
class ArgReader {
public:
    ArgReader(const nlohmann::json& args, std::string operation)
        : args_(args)
        , operation_(std::move(operation)) {}

    bool Ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

    bool Has(const char* key) const {
        return args_.is_object() && args_.contains(key) && !args_[key].is_null();
    }

    std::string String(const char* key, std::string fallback) {
        if (!Ok() || !Has(key)) {
            return fallback;
        }
        if (!args_[key].is_string()) {
            Fail(key, "a string");
            return fallback;
        }
        return args_[key].get<std::string>();
    }

    bool Bool(const char* key, bool fallback) {
        if (!Ok() || !Has(key)) {
            return fallback;
        }
        if (!args_[key].is_boolean()) {
            Fail(key, "a boolean");
            return fallback;
        }
        return args_[key].get<bool>();
    }

    int Int(const char* key, int fallback, int min_value) {
        if (!Ok() || !Has(key)) {
            return fallback;
        }
        if (!args_[key].is_number()) {
            Fail(key, "a number");
            return fallback;
        }
        const auto value = ToInt(args_[key]);
        if (!value || *value < min_value) {
            Fail(key, "an integer >= " + std::to_string(min_value));
            return fallback;
        }
        return *value;
    }

    std::vector<std::string> StringList(const char* key, std::vector<std::string> fallback) {
        if (!Ok() || !Has(key)) {
            return fallback;
        }
        const auto& value = args_[key];
        if (value.is_string()) {
            return {value.get<std::string>()};
        }
        if (!value.is_array()) {
            Fail(key, "an array of strings");
            return fallback;
        }
        std::vector<std::string> items;
        for (const auto& item : value) {
            if (!item.is_string()) {
                Fail(key, "an array of strings");
                return fallback;
            }
            items.push_back(item.get<std::string>());
        }
        return items;
    }

    void Require(const char* key, const char* type_name) {
        if (Ok() && !Has(key)) {
            error_ = "Error: repo." + operation_ + " requires \"" + key + "\" (" + type_name + ")";
        }
    }

private:
    void Fail(const char* key, const std::string& expected) {
        error_ = "Error: repo." + operation_ + ": \"" + key + "\" must be " + expected;
    }

    const nlohmann::json& args_;
    std::string operation_;
    std::string error_;
};

}  // namespace

RepoApi::RepoApi(const std::filesystem::path& root,
                 std::shared_ptr<FileTools> tools,
                 std::shared_ptr<utils::LogSink> sink)
    : root_(std::filesystem::canonical(root))
    , tools_(std::move(tools))
    , sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {
    if (!std::filesystem::is_directory(root_)) {
        throw std::invalid_argument("repository root is not a directory: " + root.string());
    }
    if (!tools_) {
        throw std::invalid_argument("repository file tools are required");
    }
}

std::shared_ptr<RepoApi> RepoApi::ForDirectory(const std::filesystem::path& root,
                                               std::shared_ptr<utils::LogSink> sink) {
    const auto canonical = std::filesystem::canonical(root);
    return std::make_shared<RepoApi>(canonical, std::make_shared<LocalFileTools>(canonical), std::move(sink));
}

nlohmann::json RepoApi::List(const nlohmann::json& args) const {
    ArgReader reader(args, "list");
    ListArgs list{};
    list.directory_path = reader.String("directoryPath", list.directory_path);
    list.include_hidden = reader.Bool("includeHidden", list.include_hidden);
    list.recursive = reader.Bool("recursive", list.recursive);
    list.max_depth = reader.Int("maxDepth", list.max_depth, 1);
    if (!reader.Ok()) {
        return reader.error();
    }

    const auto resolved = ResolveUnderRoot(root_, list.directory_path);
    if (!resolved.ok) {
        return "Error: " + resolved.error;
    }
    return tools_->List(resolved.path, list);
}

nlohmann::json RepoApi::View(const nlohmann::json& args) const {
    ArgReader reader(args, "view");
    reader.Require("filePath", "string");
    ViewArgs view{};
    view.file_path = reader.String("filePath", "");
    if (!reader.Ok()) {
        return reader.error();
    }

    if (reader.Has("viewRange")) {
        const auto& range = args["viewRange"];
        if (!range.is_array() || range.size() != 2 || !range[0].is_number() || !range[1].is_number()) {
            return std::string("Error: Invalid viewRange: expected [start, end]");
        }
        const auto first = ToInt(range[0]);
        const auto last = ToInt(range[1]);
        if (!first || !last) {
            return std::string("Error: Invalid viewRange: line numbers must be integers");
        }
        const int start = *first;
        const int end = *last;
        if (start < 1) {
            return "Error: Invalid viewRange: start line must be >= 1 (got " + std::to_string(start) + ")";
        }
        if (end != -1 && end < start) {
            return "Error: Invalid viewRange: end line must be >= start line or -1 (got [" +
                std::to_string(start) + ", " + std::to_string(end) + "])";
        }
        view.view_range = std::make_pair(start, end);
    }

    const auto resolved = ResolveUnderRoot(root_, view.file_path);
    if (!resolved.ok) {
        return "Error: " + resolved.error;
    }
    return tools_->View(resolved.path, view);
}

nlohmann::json RepoApi::Find(const nlohmann::json& args) const {
    ArgReader reader(args, "find");
    reader.Require("patterns", "array of strings");
    FindArgs find{};
    find.search_path = reader.String("searchPath", find.search_path);
    find.patterns = reader.StringList("patterns", {});
    find.exclude = reader.StringList("exclude", {});
    find.recursive = reader.Bool("recursive", find.recursive);
    find.max_results = reader.Int("maxResults", find.max_results, 1);
    find.include_hidden = reader.Bool("includeHidden", find.include_hidden);
    if (!reader.Ok()) {
        return reader.error();
    }
    if (find.patterns.empty()) {
        return std::string("Error: repo.find requires at least one pattern");
    }

    const auto resolved = ResolveUnderRoot(root_, find.search_path);
    if (!resolved.ok) {
        return "Error: " + resolved.error;
    }
    return tools_->Find(resolved.path, find);
}

nlohmann::json RepoApi::Grep(const nlohmann::json& args) const {
    ArgReader reader(args, "grep");
    reader.Require("query", "string");
    GrepArgs grep{};
    grep.search_path = reader.String("searchPath", grep.search_path);
    grep.query = reader.String("query", "");
    grep.patterns = reader.StringList("patterns", grep.patterns);
    grep.case_sensitive = reader.Bool("caseSensitive", grep.case_sensitive);
    grep.regex = reader.Bool("regex", grep.regex);
    grep.recursive = reader.Bool("recursive", grep.recursive);
    grep.max_results = reader.Int("maxResults", grep.max_results, 1);
    grep.context_before = reader.Int("contextBefore", grep.context_before, 0);
    grep.context_after = reader.Int("contextAfter", grep.context_after, 0);
    grep.exclude = reader.StringList("exclude", {});
    grep.include_hidden = reader.Bool("includeHidden", grep.include_hidden);
    if (!reader.Ok()) {
        return reader.error();
    }

    const auto resolved = ResolveUnderRoot(root_, grep.search_path);
    if (!resolved.ok) {
        return "Error: " + resolved.error;
    }
    return tools_->Grep(resolved.path, grep);
}

nlohmann::json RepoApi::Call(const std::string& operation, const nlohmann::json& args) const {
    sink_->Log(utils::LogLevel::kDebug, "repo", operation + " called", {{"args", args.dump()}});
    try {
        nlohmann::json payload;
        if (operation == "list") {
            payload = List(args);
        } else if (operation == "view") {
            payload = View(args);
        } else if (operation == "find") {
            payload = Find(args);
        } else if (operation == "grep") {
            payload = Grep(args);
        } else {
            return "Error: Unknown repo operation \"" + operation + "\"";
        }
        if (payload.is_string() && payload.get<std::string>().find(kEscapeMarker) != std::string::npos) {
            sink_->Log(utils::LogLevel::kWarn, "repo", "path escape rejected", {{"operation", operation}});
        }
        return payload;
    } catch (const std::exception& ex) {
        sink_->Log(utils::LogLevel::kWarn, "repo", operation + " failed", {{"error", ex.what()}});
        return "Error: repo." + operation + " failed: " + ex.what();
    }
}

}  // namespace librarian::repo
