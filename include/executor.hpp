#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP
#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "repo.hpp"
#include "thread_utils.hpp"

/**
 * @brief Worker count used when none is configured.
 *
 * `std::thread::hardware_concurrency()`, or 1 when it is unknown.
 */
inline size_t default_parallelism() {
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

namespace executor_detail {

template <typename T> struct Outcome {
    std::filesystem::path path;
    std::optional<T> value;
    std::exception_ptr error;
};

inline std::string describe(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace executor_detail

/**
 * @brief Run @p op once per repository on at most @p max_workers threads.
 *
 * `min(max_workers, repos.size())` workers are started up front. Each one
 * claims the next unprocessed repository through a shared atomic index,
 * queues its result and moves on until the list is exhausted. Exactly
 * `repos.size()` results are collected before returning, in completion
 * order. A `max_workers` of 0 behaves like 1.
 *
 * @p op should report failures through its return value. If it throws
 * anyway, the exception is logged, the remaining results are still
 * collected, and the first exception is rethrown once every worker is done.
 *
 * @param repos       Repositories to process.
 * @param max_workers Upper bound on concurrently running workers.
 * @param op          Callable `T(const Repo&)`; invoked concurrently.
 * @return `(path, result)` pairs, one per repository.
 */
template <typename Op>
auto run_parallel(const std::vector<Repo>& repos, size_t max_workers, Op op)
    -> std::vector<std::pair<std::filesystem::path, std::invoke_result_t<Op&, const Repo&>>> {
    using T = std::invoke_result_t<Op&, const Repo&>;
    using Outcome = executor_detail::Outcome<T>;

    std::vector<std::pair<std::filesystem::path, T>> collected;
    if (repos.empty())
        return collected;
    collected.reserve(repos.size());

    size_t concurrency = std::min(max_workers == 0 ? size_t{1} : max_workers, repos.size());
    BlockingQueue<Outcome> results;
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        while (true) {
            size_t idx = next_index.fetch_add(1);
            if (idx >= repos.size())
                break;
            const Repo& repo = repos[idx];
            Outcome out{repo.path(), std::nullopt, nullptr};
            try {
                out.value.emplace(op(repo));
            } catch (...) {
                out.error = std::current_exception();
            }
            results.push(std::move(out));
        }
    };

    std::exception_ptr first_error;
    {
        ThreadGroup workers;
        for (size_t i = 0; i < concurrency; ++i)
            workers.spawn(worker);
        for (size_t i = 0; i < repos.size(); ++i) {
            Outcome out = results.pop();
            if (out.error) {
                log_error("Repository operation failed",
                          {{"path", out.path.string()},
                           {"error", executor_detail::describe(out.error)}});
                if (!first_error)
                    first_error = out.error;
                continue;
            }
            collected.emplace_back(std::move(out.path), std::move(*out.value));
        }
    }
    if (first_error)
        std::rethrow_exception(first_error);
    return collected;
}

#endif // EXECUTOR_HPP
