#include "test_common.hpp"

using dirty::test_support::add_remote;
using dirty::test_support::fresh_dir;
using dirty::test_support::init_repo;
using dirty::test_support::write_file;

TEST_CASE("scan_repos gives the same results for any worker count") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("scan_parallel");
    for (int i = 0; i < 8; ++i) {
        fs::path repo = root / ("repo" + std::to_string(i));
        init_repo(repo);
        if (i % 2 == 0)
            add_remote(repo, "https://example.com/r" + std::to_string(i) + ".git");
        if (i % 3 == 0)
            write_file(repo / "scratch.txt", "wip\n");
    }
    auto repos = discover(root, 1);
    REQUIRE(repos.size() == 8);

    auto sequential = scan_repos(repos, true, 1);
    REQUIRE(sequential.size() == 8);
    for (size_t threads : {2u, 4u, 16u}) {
        auto parallel = scan_repos(repos, true, threads);
        REQUIRE(parallel == sequential);
    }
    REQUIRE(std::is_sorted(sequential.begin(), sequential.end(),
                           [](const RepositoryResult& a, const RepositoryResult& b) {
                               return a.path < b.path;
                           }));
    REQUIRE(sequential[0].dirty);
    REQUIRE_FALSE(sequential[0].local_only);
    REQUIRE_FALSE(sequential[1].dirty);
    REQUIRE(sequential[1].local_only);
    FS_REMOVE_ALL(root);
}

TEST_CASE("scan_repos drops repositories that cannot be opened") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("scan_broken");
    init_repo(root / "good");
    fs::create_directories(root / "broken" / ".git");

    auto repos = discover(root, 1);
    REQUIRE(repos.size() == 2);
    auto results = scan_repos(repos, false, 4);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].path == fs::canonical(root / "good"));
    FS_REMOVE_ALL(root);
}

TEST_CASE("scan_repos handles empty input and zero concurrency") {
    git::GitInitGuard guard;
    REQUIRE(scan_repos({}, false, 4).empty());
    fs::path root = fresh_dir("scan_zero");
    fs::create_directories(root / "fake" / ".git");
    REQUIRE(scan_repos({root / "fake"}, false, 0).empty());
    FS_REMOVE_ALL(root);
}
