#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace ignore {

/**
 * Check a directory against a list of ignore patterns.
 *
 * A pattern without a '/' is compared with the directory name only, a
 * pattern containing '/' with the full generic path. Patterns containing
 * '*', '?' or '[' are shell globs (fnmatch rules); anything else must match
 * exactly.
 */
bool matches(const std::filesystem::path& path, const std::vector<std::string>& patterns);

/**
 * Split a comma separated list into trimmed, non-empty entries.
 */
std::vector<std::string> split_list(const std::string& value);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
