#include "scanner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "logger.hpp"

namespace fs = std::filesystem;

std::vector<RepositoryResult> scan_repos(const std::vector<fs::path>& repos, bool compute_ahead,
                                         size_t concurrency) {
    if (repos.empty())
        return {};
    if (concurrency == 0)
        concurrency = 1;
    concurrency = std::min(concurrency, repos.size());
    if (logger_initialized())
        log_debug("Classifying repositories", {{"repos", std::to_string(repos.size())},
                                               {"threads", std::to_string(concurrency)}});

    // One slot per repository: workers never write to the same element.
    std::vector<std::optional<RepositoryResult>> slots(repos.size());
    std::atomic<size_t> next_index{0};
    std::atomic<bool> running{true};
    std::exception_ptr failure;
    std::mutex failure_mtx;

    auto worker = [&]() {
        try {
            while (running) {
                size_t idx = next_index.fetch_add(1);
                if (idx >= repos.size())
                    break;
                slots[idx] = classify(repos[idx], compute_ahead);
            }
        } catch (const std::exception& e) {
            if (logger_initialized())
                log_error(std::string("Worker thread exception: ") + e.what());
            std::lock_guard<std::mutex> lk(failure_mtx);
            if (!failure)
                failure = std::current_exception();
            running = false;
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(concurrency);
    for (size_t i = 0; i < concurrency; ++i)
        threads.emplace_back(worker);
    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }
    if (failure)
        std::rethrow_exception(failure);

    std::vector<RepositoryResult> results;
    results.reserve(repos.size());
    for (auto& slot : slots) {
        if (slot)
            results.push_back(std::move(*slot));
    }
    std::sort(results.begin(), results.end(),
              [](const RepositoryResult& a, const RepositoryResult& b) { return a.path < b.path; });
    if (logger_initialized())
        log_debug("Classification complete", {{"classified", std::to_string(results.size())},
                                              {"skipped",
                                               std::to_string(repos.size() - results.size())}});
    return results;
}
