#include "test_common.hpp"

namespace {

fs::path three_repo_fixture(const std::string& name) {
    fs::path dir = fresh_dir(name);
    init_repo(dir / "a");
    init_repo(dir / "b");
    init_repo(dir / "c");
    return dir;
}

} // namespace

TEST_CASE("Scan then list finds three repos and writes the cache") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_scan_list");
    Config cfg = test_config(dir);

    auto repos = inventory::get_repos(cfg);
    std::vector<fs::path> expected{dir / "a", dir / "b", dir / "c"};
    REQUIRE(repo_paths(repos) == expected);
    REQUIRE(read_lines(*cfg.cache_file).size() == 4);
    REQUIRE(cache::is_valid(cfg));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("A valid cache is used without rescanning") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_cached");
    Config cfg = test_config(dir);
    REQUIRE(inventory::get_repos(cfg).size() == 3);

    init_repo(dir / "d");
    REQUIRE(inventory::get_repos(cfg).size() == 3);
    inventory::clear_cache(cfg);
    REQUIRE(inventory::get_repos(cfg).size() == 4);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("A configuration change triggers a rescan") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_reconfig");
    Config cfg = test_config(dir);
    REQUIRE(inventory::get_repos(cfg).size() == 3);

    cfg.ignored_patterns = {"gg_inv_reconfig/b"};
    auto repos = inventory::get_repos(cfg);
    std::vector<fs::path> expected{dir / "a", dir / "c"};
    REQUIRE(repo_paths(repos) == expected);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Ignore then rescan leaves the ignored repo out") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_ignore");
    Config cfg = test_config(dir);
    REQUIRE(inventory::get_repos(cfg).size() == 3);

    fs::path target = dir / "b";
    std::string err;
    REQUIRE(inventory::ignore_repo(cfg, target, err));
    REQUIRE(target == fs::canonical(dir / "b"));
    REQUIRE(inventory::ignore_file_path(cfg) == dir / "ignored.txt");

    inventory::clear_cache(cfg);
    auto repos = inventory::get_repos(cfg);
    std::vector<fs::path> expected{dir / "a", dir / "c"};
    REQUIRE(repo_paths(repos) == expected);
    REQUIRE(read_lines(*cfg.cache_file).size() == 3);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Ignoring takes effect on a still-valid cache") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_ignore_cached");
    Config cfg = test_config(dir);
    REQUIRE(inventory::get_repos(cfg).size() == 3);
    fs::path target = dir / "c";
    std::string err;
    REQUIRE(inventory::ignore_repo(cfg, target, err));
    std::vector<fs::path> expected{dir / "a", dir / "b"};
    REQUIRE(repo_paths(inventory::get_repos(cfg)) == expected);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Ignoring the same repo twice is rejected") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_ignore_twice");
    Config cfg = test_config(dir);
    fs::path first = dir / "a";
    fs::path second = dir / "a" / "." / ".." / "a";
    std::string err;
    REQUIRE(inventory::ignore_repo(cfg, first, err));
    REQUIRE_FALSE(inventory::ignore_repo(cfg, second, err));
    REQUIRE(err.find("already ignored") != std::string::npos);
    REQUIRE(inventory::get_ignored_repos(cfg).size() == 1);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Ignoring a missing path fails") {
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_inv_ignore_missing");
    Config cfg = test_config(dir);
    fs::path target = dir / "nope";
    std::string err;
    REQUIRE_FALSE(inventory::ignore_repo(cfg, target, err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(fs::exists(inventory::ignore_file_path(cfg)));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Deleted repositories disappear from the inventory") {
    git::GitInitGuard guard;
    fs::path dir = three_repo_fixture("gg_inv_stale");
    Config cfg = test_config(dir);
    REQUIRE(inventory::get_repos(cfg).size() == 3);
    FS_REMOVE_ALL(dir / "b");
    std::vector<fs::path> expected{dir / "a", dir / "c"};
    REQUIRE(repo_paths(inventory::get_repos(cfg)) == expected);
    REQUIRE(read_lines(*cfg.cache_file).size() == 4);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Explicit ignore file overrides the default location") {
    fs::path dir = fresh_dir("gg_inv_ignore_file");
    Config cfg = test_config(dir);
    cfg.ignore_file = dir / "custom" / "ign.txt";
    REQUIRE(inventory::ignore_file_path(cfg) == dir / "custom" / "ign.txt");
    FS_REMOVE_ALL(dir);
}
