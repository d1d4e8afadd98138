#include "test_common.hpp"

TEST_CASE("discover_repo rejects plain directories") {
    git::GitInitGuard guard;
    fs::path dir = gitpet::test_support::fresh_dir("gitpet_plain_dir");
    std::string error;
    REQUIRE_FALSE(git::discover_repo(dir, &error).has_value());
    REQUIRE_FALSE(error.empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("discover_repo finds the enclosing work tree") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = gitpet::test_support::fresh_dir("gitpet_discover");
    gitpet::test_support::init_repo(repo);
    std::string rename = gitpet::test_support::git_in(repo) + "symbolic-ref HEAD refs/heads/trunk";
    REQUIRE(std::system(rename.c_str()) == 0);

    auto unborn = git::discover_repo(repo);
    REQUIRE(unborn.has_value());
    REQUIRE(unborn->unborn);
    REQUIRE(unborn->branch == "trunk");
    REQUIRE(unborn->head.empty());

    gitpet::test_support::write_file(repo / "deep" / "nested" / "a.txt", "a");
    gitpet::test_support::commit_all(repo, "first", std::time(nullptr));
    auto loc = git::discover_repo(repo / "deep" / "nested");
    REQUIRE(loc.has_value());
    REQUIRE_FALSE(loc->unborn);
    REQUIRE(fs::equivalent(loc->workdir, repo));
    REQUIRE(loc->branch == "trunk");
    REQUIRE(loc->head.size() == 7);
    FS_REMOVE_ALL(repo);
}

TEST_CASE("Detached HEAD has no branch") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = gitpet::test_support::fresh_dir("gitpet_detached");
    gitpet::test_support::init_repo(repo);
    gitpet::test_support::write_file(repo / "a.txt", "a");
    gitpet::test_support::commit_all(repo, "first", std::time(nullptr));
    REQUIRE(std::system((gitpet::test_support::git_in(repo) + "checkout -q --detach" REDIR)
                            .c_str()) == 0);
    auto loc = git::discover_repo(repo);
    REQUIRE(loc.has_value());
    REQUIRE(loc->branch.empty());
    REQUIRE(loc->head.size() == 7);
    FS_REMOVE_ALL(repo);
}
