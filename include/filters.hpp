#ifndef FILTERS_HPP
#define FILTERS_HPP
#include <vector>
#include "repo.hpp"

/**
 * @brief Report filters; a result must satisfy every enabled predicate.
 */
struct RepoFilters {
    bool dirty_only = false;    ///< Keep repositories with working tree changes
    bool local_only = false;    ///< Keep repositories without remotes
    bool unpushed_only = false; ///< Keep repositories ahead of their upstream
};

/**
 * @brief Whether the classifier must compute ahead counts for @a filters.
 */
bool needs_ahead(const RepoFilters& filters);

/**
 * @brief Evaluate the filter predicate for one result.
 *
 * An unknown ahead count is treated as zero, so a repository without a
 * resolvable upstream never passes `unpushed_only`.
 */
bool passes_filters(const RepositoryResult& result, const RepoFilters& filters);

/**
 * @brief Keep the results that pass @a filters, preserving their order.
 */
std::vector<RepositoryResult> apply_filters(const std::vector<RepositoryResult>& results,
                                            const RepoFilters& filters);

#endif // FILTERS_HPP
