#include "filters.hpp"
#include <algorithm>
#include <iterator>

bool needs_ahead(const RepoFilters& filters) { return filters.unpushed_only; }

bool passes_filters(const RepositoryResult& result, const RepoFilters& filters) {
    return (!filters.dirty_only || result.dirty) && (!filters.local_only || result.local_only) &&
           (!filters.unpushed_only || result.ahead.value_or(0) > 0);
}

std::vector<RepositoryResult> apply_filters(const std::vector<RepositoryResult>& results,
                                            const RepoFilters& filters) {
    std::vector<RepositoryResult> out;
    std::copy_if(results.begin(), results.end(), std::back_inserter(out),
                 [&](const RepositoryResult& r) { return passes_filters(r, filters); });
    return out;
}
