#pragma once

#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

namespace librarian::repo {

using GlobList = std::vector<std::shared_ptr<const RE2>>;

std::string GlobToRegex(const std::string& glob);
std::vector<std::string> ExpandBraceGlob(const std::string& pattern);
GlobList CompileGlobs(const std::vector<std::string>& patterns);
bool MatchAnyGlob(const GlobList& globs, std::string rel);

// "*.ts" becomes "**/*.ts" for recursive searches; patterns that already
// name a directory or a "**" segment are kept.
std::string EffectivePattern(const std::string& pattern, bool recursive);

}  // namespace librarian::repo
