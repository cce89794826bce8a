#include "git_utils.hpp"
#include <system_error>

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p / ".git", ec);
}

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description, may be null.
 */
static void set_error(std::string* error) {
    if (error)
        *error = last_error_message();
}

repo_ptr open_repository(const fs::path& path, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, path.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return repo_ptr();
    }
    return repo_ptr(raw);
}

std::optional<bool> has_worktree_changes(git_repository* repo) {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    // No GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS: an untracked directory counts
    // once, which keeps this cheap on large trees.
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    git_status_list* raw = nullptr;
    if (git_status_list_new(&raw, repo, &opts) != 0)
        return std::nullopt;
    status_list_ptr list(raw);
    return git_status_list_entrycount(list.get()) > 0;
}

std::optional<size_t> remote_count(git_repository* repo) {
    git_strarray names = {nullptr, 0};
    if (git_remote_list(&names, repo) != 0)
        return std::nullopt;
    size_t count = names.count;
    git_strarray_dispose(&names);
    return count;
}

std::optional<size_t> ahead_of_upstream(git_repository* repo) {
    git_reference* raw_head = nullptr;
    // Fails for an unborn branch.
    if (git_repository_head(&raw_head, repo) != 0)
        return std::nullopt;
    reference_ptr head(raw_head);
    if (git_repository_head_detached(repo) == 1 || !git_reference_is_branch(head.get()))
        return std::nullopt;
    const git_oid* head_oid = git_reference_target(head.get());
    if (!head_oid)
        return std::nullopt;

    const char* name = git_reference_shorthand(head.get());
    if (!name)
        return std::nullopt;
    git_reference* raw_branch = nullptr;
    if (git_branch_lookup(&raw_branch, repo, name, GIT_BRANCH_LOCAL) != 0)
        return std::nullopt;
    reference_ptr branch(raw_branch);

    git_reference* raw_upstream = nullptr;
    if (git_branch_upstream(&raw_upstream, branch.get()) != 0)
        return std::nullopt;
    reference_ptr upstream(raw_upstream);
    const git_oid* upstream_oid = git_reference_target(upstream.get());
    if (!upstream_oid)
        return std::nullopt;

    size_t ahead = 0;
    size_t behind = 0;
    if (git_graph_ahead_behind(&ahead, &behind, repo, head_oid, upstream_oid) != 0)
        return std::nullopt;
    return ahead;
}

} // namespace git
