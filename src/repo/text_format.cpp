#include "repo/text_format.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace librarian::repo {
namespace {

constexpr int kMinLineNumWidth = 3;
constexpr const char* kArrow = "→";
constexpr const char* kGapMarker = "⁝";
constexpr const char* kFileSeparator = "--";

int LineNumWidth(int last_line) {
    return std::max<int>(kMinLineNumWidth, static_cast<int>(std::to_string(last_line).size()));
}

std::string PadLeft(const std::string& value, int width) {
    if (static_cast<int>(value.size()) >= width) {
        return value;
    }
    return std::string(static_cast<std::size_t>(width) - value.size(), ' ') + value;
}

}  // namespace

std::string WithLineNumbers(const std::vector<std::string>& lines, int start_line) {
    if (lines.empty()) {
        return {};
    }
    const int width = LineNumWidth(start_line + static_cast<int>(lines.size()) - 1);
    std::ostringstream oss;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            oss << "\n";
        }
        oss << PadLeft(std::to_string(start_line + static_cast<int>(i)), width) << kArrow << lines[i];
    }
    return oss.str();
}

std::string FormatLinesWithRange(const std::vector<std::string>& lines,
                                 const std::optional<std::pair<int, int>>& range) {
    if (lines.empty()) {
        return "[File is empty]";
    }
    if (!range) {
        return WithLineNumbers(lines);
    }
    const auto [start, end] = *range;
    const auto total = static_cast<int>(lines.size());
    const int start_index = std::min(std::max(0, start - 1), total);
    const int end_index = end == -1 ? total : std::min(total, end);
    if (start_index >= end_index) {
        return "[No lines in range " + std::to_string(start) + "-" + std::to_string(end) +
            ", file has " + std::to_string(total) + " lines]";
    }
    std::vector<std::string> selected(lines.begin() + start_index, lines.begin() + end_index);
    return WithLineNumbers(selected, start);
}

std::string FormatDirectoryTree(const std::vector<TreeEntry>& entries) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (i > 0) {
            oss << "\n";
        }
        oss << std::string(static_cast<std::size_t>(entry.depth) * 2, ' ') << entry.name;
        if (entry.is_directory) {
            oss << "/";
        } else if (entry.line_count) {
            oss << " (" << *entry.line_count << " lines)";
        } else if (entry.size) {
            oss << " (" << *entry.size << " bytes)";
        }
    }
    return oss.str();
}

std::string FormatSearchResults(const std::vector<FileMatches>& results) {
    std::size_t total = 0;
    for (const auto& result : results) {
        total += result.matches.size();
    }

    std::ostringstream oss;
    oss << "Found " << total << " matches in " << results.size() << " files:\n\n";

    for (std::size_t file_index = 0; file_index < results.size(); ++file_index) {
        const auto& result = results[file_index];
        oss << result.path << "\n";

        auto sorted = result.matches;
        std::stable_sort(sorted.begin(), sorted.end(), [](const SearchMatch& a, const SearchMatch& b) {
            return a.line < b.line;
        });

        int max_line = 0;
        for (const auto& match : sorted) {
            max_line = std::max(max_line, match.line + static_cast<int>(match.after.size()));
        }
        const int width = LineNumWidth(max_line);

        std::set<int> displayed;
        int last_printed = -1;
        auto emit = [&](int line_num, const std::string& text) {
            if (displayed.count(line_num)) {
                return;
            }
            if (last_printed != -1 && line_num > last_printed + 1) {
                oss << std::string(static_cast<std::size_t>(width), ' ') << kGapMarker << "\n";
            }
            oss << PadLeft(std::to_string(line_num), width) << kArrow << text << "\n";
            displayed.insert(line_num);
            last_printed = line_num;
        };

        for (const auto& match : sorted) {
            const int before_start = std::max(1, match.line - static_cast<int>(match.before.size()));
            for (std::size_t j = 0; j < match.before.size(); ++j) {
                emit(before_start + static_cast<int>(j), match.before[j]);
            }
            emit(match.line, match.text);
            for (std::size_t j = 0; j < match.after.size(); ++j) {
                emit(match.line + 1 + static_cast<int>(j), match.after[j]);
            }
        }

        if (file_index + 1 < results.size()) {
            oss << kFileSeparator << "\n";
        }
    }
    return oss.str();
}

}  // namespace librarian::repo
