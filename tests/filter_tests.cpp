#include "test_common.hpp"

static RepositoryResult make_result(const std::string& path, bool dirty, bool local,
                                    std::optional<size_t> ahead = std::nullopt) {
    RepositoryResult r;
    r.path = path;
    r.dirty = dirty;
    r.local_only = local;
    r.ahead = ahead;
    return r;
}

TEST_CASE("No filters keep every result") {
    RepoFilters none;
    REQUIRE(passes_filters(make_result("/a", false, false), none));
    REQUIRE(passes_filters(make_result("/b", true, true, 3), none));
    REQUIRE_FALSE(needs_ahead(none));
}

TEST_CASE("Dirty and local filters combine with AND") {
    RepoFilters f;
    f.dirty_only = true;
    REQUIRE(passes_filters(make_result("/a", true, false), f));
    REQUIRE_FALSE(passes_filters(make_result("/b", false, true), f));

    f.local_only = true;
    REQUIRE(passes_filters(make_result("/c", true, true), f));
    REQUIRE_FALSE(passes_filters(make_result("/d", true, false), f));
    REQUIRE_FALSE(passes_filters(make_result("/e", false, true), f));
}

TEST_CASE("Unpushed filter treats unknown ahead as zero") {
    RepoFilters f;
    f.unpushed_only = true;
    REQUIRE(needs_ahead(f));
    REQUIRE(passes_filters(make_result("/a", false, false, 1), f));
    REQUIRE_FALSE(passes_filters(make_result("/b", false, false, 0), f));
    REQUIRE_FALSE(passes_filters(make_result("/c", true, true), f));
}

TEST_CASE("apply_filters preserves order") {
    std::vector<RepositoryResult> all{make_result("/a", true, false),
                                      make_result("/b", false, false),
                                      make_result("/c", true, true)};
    RepoFilters f;
    f.dirty_only = true;
    auto kept = apply_filters(all, f);
    REQUIRE(kept.size() == 2);
    REQUIRE(kept[0].path == "/a");
    REQUIRE(kept[1].path == "/c");

    f.local_only = true;
    f.dirty_only = false;
    kept = apply_filters(all, f);
    REQUIRE(kept == std::vector<RepositoryResult>{all[2]});
    REQUIRE(apply_filters({}, f).empty());
}
