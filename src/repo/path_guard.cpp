#include "repo/path_guard.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace librarian::repo {
namespace {

constexpr int kMaxDecodeRounds = 4;

int HexValue(char x) {
    if (x >= '0' && x <= '9') return x - '0';
    if (x >= 'a' && x <= 'f') return 10 + (x - 'a');
    if (x >= 'A' && x <= 'F') return 10 + (x - 'A');
    return -1;
}

std::string NormalizeRequest(const std::string& requested) {
    std::string raw = requested;
    // Double-encoded input ("%252e%252e") must not survive as "%2e%2e".
    for (int round = 0; round < kMaxDecodeRounds; ++round) {
        auto decoded = PercentDecode(raw);
        if (decoded == raw) {
            break;
        }
        raw = std::move(decoded);
    }
    std::replace(raw.begin(), raw.end(), '\\', '/');

    constexpr const char* kFileScheme = "file://";
    if (utils::ToLower(raw).rfind(kFileScheme, 0) == 0) {
        raw = raw.substr(std::char_traits<char>::length(kFileScheme));
        if (raw.rfind("localhost/", 0) == 0) {
            raw = raw.substr(9);
        }
    }
    return raw;
}

}  // namespace

std::string PercentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char ch = in[i];
        if (ch == '%' && i + 2 < in.size()) {
            const int ha = HexValue(in[i + 1]);
            const int hb = HexValue(in[i + 2]);
            if (ha >= 0 && hb >= 0) {
                out.push_back(static_cast<char>((ha << 4) | hb));
                i += 2;
                continue;
            }
        }
        out.push_back(ch);
    }
    return out;
}

std::string EscapeMessage(const std::string& requested) {
    return "Path \"" + requested + "\" attempts to " + kEscapeMarker;
}

bool IsWithinRoot(const std::filesystem::path& canonical_root,
                  const std::filesystem::path& candidate) {
    auto root_it = canonical_root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++cand_it) {
        // A trailing separator shows up as an empty final component.
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

PathResolution ResolveUnderRoot(const std::filesystem::path& canonical_root,
                                const std::string& requested) {
    PathResolution result{};
    const auto raw = NormalizeRequest(requested);
    if (raw.find('\0') != std::string::npos) {
        result.error = "Path \"" + requested + "\" contains a NUL byte";
        return result;
    }

    std::filesystem::path candidate = raw.empty() ? std::filesystem::path(".") : std::filesystem::path(raw);
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(candidate.lexically_normal(), ec);
    if (ec) {
        result.error = "Path \"" + requested + "\" could not be resolved: " + ec.message();
        return result;
    }

    if (!IsWithinRoot(canonical_root, canonical)) {
        result.escaped = true;
        result.error = EscapeMessage(requested);
        return result;
    }

    result.ok = true;
    result.path = std::move(canonical);
    return result;
}

std::string RelativeToRoot(const std::filesystem::path& canonical_root,
                           const std::filesystem::path& path) {
    auto relative = path.lexically_relative(canonical_root).generic_string();
    if (relative.empty()) {
        return ".";
    }
    return relative;
}

}  // namespace librarian::repo
