#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace conductor {

// Slash-delimited context paths. "repo//files/" normalizes to "repo/files";
// the empty path is the root and is a prefix of every path.

std::string normalize_path(std::string_view path);

std::vector<std::string> split_path(std::string_view path);

std::string join_path(const std::vector<std::string>& segments);

// True if `prefix` equals `path` or names one of its ancestors.
// Matching is by whole segments: "repo" covers "repo/files", not "repository".
// Both arguments must already be normalized.
bool path_has_prefix(std::string_view path, std::string_view prefix);

// Deepest path that is a whole-segment prefix of every entry in `paths`.
// Empty (the root) when `paths` is empty or the entries share nothing.
std::string common_prefix(const std::vector<std::string>& paths);

// Replace every "{run}" token with the run id, then normalize.
std::string expand_run_placeholder(std::string_view path, std::string_view run_id);

} // namespace conductor
