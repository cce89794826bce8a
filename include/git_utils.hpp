#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application, before any worker
 * thread touches a repository.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// Move-only RAII wrapper for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& other) noexcept : h(other.h) { other.h = nullptr; }
    GitHandle& operator=(GitHandle&& other) noexcept {
        if (this != &other) {
            if (h)
                Free(h);
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }
    ~GitHandle() {
        if (h)
            Free(h);
    }
    T* get() const { return h; }
    explicit operator bool() const { return h != nullptr; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

// The functions below assume libgit2 is already initialized. They only read
// from the repository and are safe to call concurrently on distinct handles.

/**
 * @brief Determine whether the given directory is a Git working copy root.
 *
 * @param p Directory to check.
 * @return `true` if a `.git` entry (directory or gitdir file) exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Open the repository rooted at @a path.
 *
 * Discovery of parent repositories is disabled: @a path itself must hold the
 * repository metadata.
 *
 * @param path  Working copy root.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Owning handle; empty on failure.
 */
repo_ptr open_repository(const fs::path& path, std::string* error = nullptr);

/**
 * @brief Check for tracked modifications or top-level untracked entries.
 *
 * Untracked directories are reported as a single entry without recursing
 * into them; submodules are excluded.
 *
 * @return `true` when the status list is non-empty, `std::nullopt` if the
 *         status could not be computed.
 */
std::optional<bool> has_worktree_changes(git_repository* repo);

/**
 * @brief Count the configured remotes. Reads configuration only.
 *
 * @return Number of remotes or `std::nullopt` if the list cannot be read.
 */
std::optional<size_t> remote_count(git_repository* repo);

/**
 * @brief Number of commits on the current branch missing from its upstream.
 *
 * Resolves HEAD, the local branch it points to, and that branch's configured
 * upstream, then runs an ahead/behind graph walk. The behind count is
 * discarded.
 *
 * @return Ahead count or `std::nullopt` for a detached or unborn HEAD, a
 *         branch without upstream, or any other lookup failure.
 */
std::optional<size_t> ahead_of_upstream(git_repository* repo);

/**
 * @brief Text of the most recent libgit2 error on this thread.
 */
std::string last_error_message();

} // namespace git

#endif // GIT_UTILS_HPP
