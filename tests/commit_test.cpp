#include <catch2/catch.hpp>
#include "checkout.hpp"
#include "commit.hpp"
#include "config.hpp"
#include "content_hasher.hpp"
#include "index_store.hpp"
#include "log_store.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using svcs::CommitStore;
using svcs::IndexStore;
using svcs::LogStore;
using svcs::Status;

static std::string currentIdentifier(const TempWorkspace& ws) {
    return svcs::computeIdentifier(IndexStore(ws.ctx()).currentTrackedFiles());
}

TEST_CASE("Commit: nothing tracked means nothing to commit", "[commit]") {
    TempWorkspace ws;

    auto result = CommitStore(ws.ctx()).commit("init");

    CHECK(result.status == Status::NothingToCommit);
    CHECK(result.message == "Nothing to commit.");
    CHECK(ws.commitCount() == 0);
    CHECK(ws.read("vcs/log.txt").empty());
}

TEST_CASE("Commit: first commit stores the tracked files and one log entry", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    svcs::saveConfig(ws.ctx(), svcs::Config{"alice"});
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    const std::string id = currentIdentifier(ws);

    auto result = CommitStore(ws.ctx()).commit("first");

    CHECK(result.status == Status::Created);
    CHECK(result.message == "Changes are committed.");
    CHECK(ws.commitCount() == 1);
    CHECK(ws.read("vcs/commits/" + id + "/a.txt") == "hello");
    CHECK(ws.read("vcs/log.txt") == "commit " + id + "\nAuthor: alice\nfirst");
}

TEST_CASE("Commit: committing an unchanged set twice is a no-op", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    CommitStore store(ws.ctx());
    REQUIRE(store.commit("first").status == Status::Created);
    const std::string logAfterFirst = ws.read("vcs/log.txt");

    auto result = store.commit("again");

    CHECK(result.status == Status::NothingToCommit);
    CHECK(ws.commitCount() == 1);
    CHECK(ws.read("vcs/log.txt") == logAfterFirst);
}

TEST_CASE("Commit: a modified file produces a new commit, newest first in the log", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    CommitStore store(ws.ctx());
    REQUIRE(store.commit("first").status == Status::Created);
    const std::string firstId = currentIdentifier(ws);

    ws.write("a.txt", "world");
    const std::string secondId = currentIdentifier(ws);
    auto result = store.commit("second");

    CHECK(result.status == Status::Created);
    CHECK(firstId != secondId);
    CHECK(ws.commitCount() == 2);
    CHECK(ws.read("vcs/commits/" + firstId + "/a.txt") == "hello");
    CHECK(ws.read("vcs/commits/" + secondId + "/a.txt") == "world");
    CHECK(ws.read("vcs/log.txt") ==
          "commit " + secondId + "\nAuthor: \nsecond\n\n"
          "commit " + firstId + "\nAuthor: \nfirst");
}

TEST_CASE("Commit: returning to an older snapshot logs again but reuses its directory", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    CommitStore store(ws.ctx());
    REQUIRE(store.commit("first").status == Status::Created);
    const std::string firstId = currentIdentifier(ws);

    ws.write("a.txt", "world");
    REQUIRE(store.commit("second").status == Status::Created);

    ws.write("a.txt", "hello");
    auto result = store.commit("back again");

    CHECK(result.status == Status::Created);
    CHECK(ws.commitCount() == 2);
    CHECK(LogStore(ws.ctx()).latestIs(firstId));
    CHECK(ws.read("vcs/log.txt").rfind("commit " + firstId + "\nAuthor: \nback again\n\n", 0) == 0);
}

TEST_CASE("Commit: every tracked file is copied in index order", "[commit]") {
    TempWorkspace ws;
    ws.write("b.txt", "bee");
    ws.write("docs/a.md", "ay");
    IndexStore index(ws.ctx());
    REQUIRE(index.trackFile("b.txt").ok());
    REQUIRE(index.trackFile("docs/a.md").ok());
    const std::string id = currentIdentifier(ws);

    REQUIRE(CommitStore(ws.ctx()).commit("two files").status == Status::Created);

    CHECK(ws.read("vcs/commits/" + id + "/b.txt") == "bee");
    CHECK(ws.read("vcs/commits/" + id + "/docs/a.md") == "ay");
}

TEST_CASE("Commit: tracked files that disappeared are left out", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    ws.write("b.txt", "world");
    IndexStore index(ws.ctx());
    REQUIRE(index.trackFile("a.txt").ok());
    REQUIRE(index.trackFile("b.txt").ok());
    fs::remove(ws.path() / "b.txt");
    const std::string id = currentIdentifier(ws);

    REQUIRE(CommitStore(ws.ctx()).commit("only a").status == Status::Created);

    CHECK(ws.exists("vcs/commits/" + id + "/a.txt"));
    CHECK_FALSE(ws.exists("vcs/commits/" + id + "/b.txt"));
}

TEST_CASE("Commit: nothing to commit once every tracked file is gone", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    fs::remove(ws.path() / "a.txt");

    CHECK(CommitStore(ws.ctx()).commit("gone").status == Status::NothingToCommit);
    CHECK(ws.commitCount() == 0);
}

TEST_CASE("Commit: the log never becomes part of a snapshot", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    IndexStore index(ws.ctx());
    REQUIRE(index.trackFile("a.txt").ok());
    REQUIRE(index.trackFile("vcs/log.txt").status == Status::NotFound);
    ws.write("vcs/index.txt", "a.txt\nvcs/log.txt");
    CommitStore store(ws.ctx());

    REQUIRE(store.commit("first").status == Status::Created);
    const std::string firstId = currentIdentifier(ws);
    CHECK(store.commit("again").status == Status::NothingToCommit);
    CHECK(ws.commitCount() == 1);
    CHECK_FALSE(ws.exists("vcs/commits/" + firstId + "/vcs"));

    ws.write("a.txt", "world");
    REQUIRE(store.commit("second").status == Status::Created);
    const std::string logBefore = ws.read("vcs/log.txt");

    REQUIRE(svcs::checkout(ws.ctx(), firstId).status == Status::Restored);
    CHECK(ws.read("vcs/log.txt") == logBefore);
}

TEST_CASE("Commit: a failed snapshot leaves no commit directory behind", "[commit]") {
    TempWorkspace ws;
    const fs::path dir = ws.ctx().commitDir("broken");
    // "x" is written as a file, so "x/y" can't get its parent directory
    const std::vector<svcs::TrackedFile> files = {
        {"x", ws.path() / "x", "file"},
        {"x/y", ws.path() / "x" / "y", "nested"},
    };

    CHECK_THROWS(svcs::writeSnapshot(dir, files));
    CHECK_FALSE(fs::exists(dir));
    CHECK_FALSE(fs::exists(ws.ctx().commitsDir / "broken.partial"));
}

TEST_CASE("Commit: leftovers of an interrupted commit are discarded", "[commit]") {
    TempWorkspace ws;
    ws.write("a.txt", "hello");
    REQUIRE(IndexStore(ws.ctx()).trackFile("a.txt").ok());
    const std::string id = currentIdentifier(ws);
    ws.write("vcs/commits/" + id + ".partial/stale.txt", "half written");

    REQUIRE(CommitStore(ws.ctx()).commit("first").status == Status::Created);

    CHECK(ws.read("vcs/commits/" + id + "/a.txt") == "hello");
    CHECK_FALSE(ws.exists("vcs/commits/" + id + "/stale.txt"));
    CHECK_FALSE(ws.exists("vcs/commits/" + id + ".partial"));
    CHECK(ws.commitCount() == 1);
}
