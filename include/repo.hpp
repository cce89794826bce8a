#ifndef REPO_HPP
#define REPO_HPP
#include <cstddef>
#include <filesystem>
#include <optional>

/**
 * @brief Classification of one discovered working copy.
 *
 * Built once per repository by `classify()` and not modified afterwards.
 */
struct RepositoryResult {
    std::filesystem::path path;  ///< Canonical path of the working copy root
    bool dirty = false;          ///< Tracked changes or top-level untracked entries
    bool local_only = false;     ///< No remotes configured (or they could not be listed)
    std::optional<size_t> ahead; ///< Commits not on upstream; empty when not computed
                                 ///< or not determinable
};

inline bool operator==(const RepositoryResult& a, const RepositoryResult& b) {
    return a.path == b.path && a.dirty == b.dirty && a.local_only == b.local_only &&
           a.ahead == b.ahead;
}

inline bool operator!=(const RepositoryResult& a, const RepositoryResult& b) { return !(a == b); }

#endif // REPO_HPP
