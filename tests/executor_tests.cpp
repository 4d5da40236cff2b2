#include "test_common.hpp"
#include "executor.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace {

std::vector<Repo> fake_repos(size_t n) {
    std::vector<Repo> repos;
    for (size_t i = 0; i < n; ++i)
        repos.emplace_back(fs::path("/fake/repo" + std::to_string(i)));
    return repos;
}

} // namespace

TEST_CASE("run_parallel never exceeds the worker limit") {
    auto repos = fake_repos(40);
    for (size_t limit : {1u, 3u, 8u}) {
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        auto results = run_parallel(repos, limit, [&](const Repo&) {
            int now = ++active;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --active;
            return now;
        });
        REQUIRE(results.size() == repos.size());
        REQUIRE(peak.load() >= 1);
        REQUIRE(static_cast<size_t>(peak.load()) <= limit);
    }
}

TEST_CASE("run_parallel returns one result per repository") {
    auto repos = fake_repos(25);
    auto results =
        run_parallel(repos, 4, [](const Repo& repo) { return repo.path_string() + "!"; });
    REQUIRE(results.size() == repos.size());
    std::set<fs::path> seen;
    for (const auto& [path, value] : results) {
        REQUIRE(value == path.string() + "!");
        seen.insert(path);
    }
    std::set<fs::path> expected;
    for (const auto& r : repos)
        expected.insert(r.path());
    REQUIRE(seen == expected);
}

TEST_CASE("run_parallel treats a zero limit as one") {
    auto repos = fake_repos(5);
    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};
    auto results = run_parallel(repos, 0, [&](const Repo&) {
        if (++active > 1)
            overlapped = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
        return true;
    });
    REQUIRE(results.size() == 5);
    REQUIRE_FALSE(overlapped.load());
}

TEST_CASE("run_parallel on an empty list returns immediately") {
    auto results = run_parallel(std::vector<Repo>{}, 4, [](const Repo&) { return 1; });
    REQUIRE(results.empty());
}

TEST_CASE("run_parallel rethrows after every worker finished") {
    auto repos = fake_repos(10);
    std::atomic<int> finished{0};
    REQUIRE_THROWS_AS(run_parallel(repos, 3,
                                   [&](const Repo& repo) {
                                       std::this_thread::sleep_for(std::chrono::milliseconds(2));
                                       ++finished;
                                       if (repo.path() == fs::path("/fake/repo4"))
                                           throw std::runtime_error("boom");
                                       return 0;
                                   }),
                      std::runtime_error);
    REQUIRE(finished.load() == 10);
}

TEST_CASE("default_parallelism is at least one") { REQUIRE(default_parallelism() >= 1); }

TEST_CASE("run_parallel reuses a fixed set of worker threads") {
    auto repos = fake_repos(2000);
    std::mutex mtx;
    std::set<std::thread::id> ids;
    auto results = run_parallel(repos, 2, [&](const Repo&) {
        std::lock_guard<std::mutex> lk(mtx);
        ids.insert(std::this_thread::get_id());
        return 0;
    });
    REQUIRE(results.size() == repos.size());
    REQUIRE(ids.size() >= 1);
    REQUIRE(ids.size() <= 2);
    REQUIRE(ids.count(std::this_thread::get_id()) == 0);
}
