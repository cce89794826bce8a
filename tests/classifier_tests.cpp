#include "test_common.hpp"

using dirty::test_support::add_remote;
using dirty::test_support::fresh_dir;
using dirty::test_support::git;
using dirty::test_support::init_repo;
using dirty::test_support::write_file;

TEST_CASE("classify reports a clean repository with a remote") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_clean");
    fs::path repo = root / "clean";
    init_repo(repo);
    add_remote(repo, "https://example.com/repo.git");

    auto res = classify(repo, false);
    REQUIRE(res);
    REQUIRE(res->path == repo);
    REQUIRE_FALSE(res->dirty);
    REQUIRE_FALSE(res->local_only);
    REQUIRE_FALSE(res->ahead.has_value());
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify detects untracked and modified files") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_dirty");
    fs::path repo = root / "work";
    init_repo(repo);

    write_file(repo / "untracked.txt", "new\n");
    auto res = classify(repo, false);
    REQUIRE(res);
    REQUIRE(res->dirty);

    REQUIRE(git(repo, "add untracked.txt") == 0);
    REQUIRE(git(repo, "commit -q -m add") == 0);
    res = classify(repo, false);
    REQUIRE(res);
    REQUIRE_FALSE(res->dirty);

    write_file(repo / "untracked.txt", "changed\n");
    res = classify(repo, false);
    REQUIRE(res);
    REQUIRE(res->dirty);
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify counts an untracked directory as dirty") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_untracked_dir");
    fs::path repo = root / "work";
    init_repo(repo);
    write_file(repo / "newdir" / "deeper" / "file.txt", "x\n");
    auto res = classify(repo, false);
    REQUIRE(res);
    REQUIRE(res->dirty);
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify flags repositories without remotes as local-only") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_local");
    fs::path repo = root / "solo";
    init_repo(repo);

    auto res = classify(repo, false);
    REQUIRE(res);
    REQUIRE(res->local_only);

    add_remote(repo, "https://example.com/solo.git");
    res = classify(repo, false);
    REQUIRE(res);
    REQUIRE_FALSE(res->local_only);
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify counts commits ahead of upstream") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_ahead");
    fs::path remote = root / "remote.git";
    fs::path repo = root / "work";
    fs::create_directories(remote);
    REQUIRE(git(remote, "init -q --bare") == 0);
    init_repo(repo);
    add_remote(repo, remote.string());
    REQUIRE(git(repo, "push -q -u origin HEAD") == 0);

    auto res = classify(repo, true);
    REQUIRE(res);
    REQUIRE(res->ahead == std::optional<size_t>(0));

    REQUIRE(git(repo, "commit -q --allow-empty -m second") == 0);
    REQUIRE(git(repo, "commit -q --allow-empty -m third") == 0);
    res = classify(repo, true);
    REQUIRE(res);
    REQUIRE(res->ahead == std::optional<size_t>(2));
    REQUIRE_FALSE(res->local_only);

    res = classify(repo, false);
    REQUIRE(res);
    REQUIRE_FALSE(res->ahead.has_value());
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify leaves ahead empty without an upstream") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_no_upstream");
    fs::path tracked = root / "no_upstream";
    init_repo(tracked);
    add_remote(tracked, "https://example.com/x.git");
    auto res = classify(tracked, true);
    REQUIRE(res);
    REQUIRE_FALSE(res->ahead.has_value());

    fs::path unborn = root / "unborn";
    fs::create_directories(unborn);
    REQUIRE(git(unborn, "init -q") == 0);
    res = classify(unborn, true);
    REQUIRE(res);
    REQUIRE_FALSE(res->dirty);
    REQUIRE(res->local_only);
    REQUIRE_FALSE(res->ahead.has_value());

    fs::path detached = root / "detached";
    init_repo(detached);
    REQUIRE(git(detached, "checkout -q --detach") == 0);
    res = classify(detached, true);
    REQUIRE(res);
    REQUIRE_FALSE(res->ahead.has_value());
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify returns nothing for unreadable repositories") {
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_broken");
    fs::create_directories(root / "plain");
    fs::create_directories(root / "fake" / ".git");
    REQUIRE_FALSE(classify(root / "plain", false));
    REQUIRE_FALSE(classify(root / "fake", true));
    FS_REMOVE_ALL(root);
}

TEST_CASE("classify does not report the parent of a nested repository") {
    if (!have_git()) {
        WARN("Skipping test because git is not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("classify_nested");
    init_repo(root / "parent");
    init_repo(root / "parent" / "child");
    add_remote(root / "parent" / "child", "https://example.com/child.git");

    auto found = discover(root, 3);
    REQUIRE(found.size() == 1);
    auto res = classify(found.front(), false);
    REQUIRE(res);
    REQUIRE(res->path == fs::canonical(root / "parent"));
    REQUIRE(res->local_only);
    FS_REMOVE_ALL(root);
}
