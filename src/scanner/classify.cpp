#include "scanner.hpp"

#include <string>

#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

std::optional<RepositoryResult> classify(const fs::path& path, bool compute_ahead) {
    std::string error;
    git::repo_ptr repo = git::open_repository(path, &error);
    if (!repo) {
        if (logger_initialized())
            log_debug("Cannot open repository", {{"path", path.string()}, {"error", error}});
        return std::nullopt;
    }

    auto dirty = git::has_worktree_changes(repo.get());
    if (!dirty) {
        if (logger_initialized())
            log_debug("Cannot read status", {{"path", path.string()},
                                             {"error", git::last_error_message()}});
        return std::nullopt;
    }

    RepositoryResult result;
    result.path = path;
    result.dirty = *dirty;
    // A remote list that cannot be read counts as having no remotes.
    result.local_only = git::remote_count(repo.get()).value_or(0) == 0;
    if (compute_ahead)
        result.ahead = git::ahead_of_upstream(repo.get());

    if (logger_initialized()) {
        log_debug("Classified repository",
                  {{"path", path.string()},
                   {"dirty", result.dirty ? "true" : "false"},
                   {"local_only", result.local_only ? "true" : "false"},
                   {"ahead", result.ahead ? std::to_string(*result.ahead) : "-"}});
    }
    return result;
}
