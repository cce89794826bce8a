#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "repo.hpp"

/**
 * @brief Find Git working copies below @a root.
 *
 * Depth-first walk starting at depth 0 with @a root resolved to its canonical
 * form. A directory containing a `.git` entry is recorded and not descended
 * into, so nested repositories are never reported. Otherwise, while the
 * current depth is at most @a max_depth, child directories are visited at
 * depth + 1; symbolic links are not followed and unreadable directories are
 * skipped. Child directories matching @a ignore_patterns are pruned.
 *
 * @param root            Scan root.
 * @param max_depth       Maximum number of directory levels below @a root.
 * @param ignore_patterns Directory name or path patterns to skip.
 * @return Repository roots sorted lexicographically.
 * @throws ScanError (PathUnavailable) if @a root cannot be resolved or is not
 *         a directory.
 */
std::vector<std::filesystem::path> discover(const std::filesystem::path& root, size_t max_depth,
                                            const std::vector<std::string>& ignore_patterns = {});

/**
 * @brief Inspect a single repository.
 *
 * Opens its own libgit2 handle, so concurrent calls on different paths share
 * no state.
 *
 * @param path          Repository root returned by discover().
 * @param compute_ahead Also resolve the upstream and count unpushed commits.
 * @return Result record, or `std::nullopt` if the repository cannot be opened
 *         or its status cannot be read.
 */
std::optional<RepositoryResult> classify(const std::filesystem::path& path, bool compute_ahead);

/**
 * @brief Classify every repository in @a repos on a bounded worker pool.
 *
 * @param repos         Repository roots.
 * @param compute_ahead Forwarded to classify().
 * @param concurrency   Worker thread count; clamped to [1, repos.size()].
 * @return Results for every repository that could be classified, sorted by path.
 */
std::vector<RepositoryResult> scan_repos(const std::vector<std::filesystem::path>& repos,
                                         bool compute_ahead, size_t concurrency);

#endif // SCANNER_HPP
