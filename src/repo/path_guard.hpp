#pragma once

#include <filesystem>
#include <string>

namespace librarian::repo {

// Substring present in every rejection produced by ResolveUnderRoot.
inline constexpr const char* kEscapeMarker = "escape the working directory sandbox";

struct PathResolution {
    bool ok = false;
    bool escaped = false;
    std::filesystem::path path;
    std::string error;
};

std::string PercentDecode(const std::string& in);

// Resolves a caller-supplied path against a canonical root. Percent-encoding,
// backslash separators, file:// prefixes, "..", absolute paths and symlinks
// are all normalised before the containment check.
PathResolution ResolveUnderRoot(const std::filesystem::path& canonical_root,
                                const std::string& requested);

bool IsWithinRoot(const std::filesystem::path& canonical_root,
                  const std::filesystem::path& candidate);

std::string EscapeMessage(const std::string& requested);

// Root-relative generic path, "." for the root itself.
std::string RelativeToRoot(const std::filesystem::path& canonical_root,
                           const std::filesystem::path& path);

}  // namespace librarian::repo
