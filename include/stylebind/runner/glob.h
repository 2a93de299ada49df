#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::runner {

// "{a,b}c" -> {"ac", "bc"}. Nested groups expand recursively.
std::vector<std::string> expand_braces(std::string_view pattern);

// '/'-separated glob match: "*" and "?" stay within a segment, "**" spans
// any number of segments, "[...]" is a character class, "{a,b}" picks one
// alternative. Dot files match like any other name.
bool glob_match(std::string_view pattern, std::string_view path);

// Absolute paths of the regular files under `cwd` matching `pattern`
// (relative to `cwd` unless absolute), sorted.
std::vector<std::string> expand_glob(const std::string& pattern, const std::string& cwd);

} // namespace stylebind::runner
