#include "scanner.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include "git_utils.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"
#include "scan_error.hpp"

namespace fs = std::filesystem;

namespace {

struct WalkContext {
    size_t max_depth;
    const std::vector<std::string>& ignore;
    std::vector<fs::path>& found;
};

void collect_repos(const fs::path& dir, size_t depth, WalkContext& ctx) {
    if (depth > ctx.max_depth)
        return;
    if (git::is_git_repo(dir)) {
        ctx.found.push_back(dir);
        return;
    }
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (logger_initialized())
            log_debug("Skipping unreadable directory", {{"path", dir.string()},
                                                        {"error", ec.message()}});
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        const fs::directory_entry& entry = *it;
        std::error_code st_ec;
        if (entry.is_symlink(st_ec) || !entry.is_directory(st_ec))
            continue;
        const fs::path& child = entry.path();
        if (child.filename() == ".git")
            continue;
        if (ignore::matches(child, ctx.ignore))
            continue;
        collect_repos(child, depth + 1, ctx);
    }
    if (ec && logger_initialized())
        log_debug("Directory listing interrupted", {{"path", dir.string()},
                                                   {"error", ec.message()}});
}

} // namespace

std::vector<fs::path> discover(const fs::path& root, size_t max_depth,
                               const std::vector<std::string>& ignore_patterns) {
    std::error_code ec;
    fs::path base = fs::canonical(root, ec);
    if (ec || !fs::is_directory(base, ec))
        throw ScanError(ScanErrorKind::PathUnavailable,
                        "dirty: cannot access '" + root.string() + "'");

    std::vector<fs::path> found;
    WalkContext ctx{max_depth, ignore_patterns, found};
    collect_repos(base, 0, ctx);
    std::sort(found.begin(), found.end());
    if (logger_initialized())
        log_debug("Discovery finished", {{"root", base.string()},
                                         {"max_depth", std::to_string(max_depth)},
                                         {"repos", std::to_string(found.size())}});
    return found;
}
