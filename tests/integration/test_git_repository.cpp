#include <catch2/catch_test_macros.hpp>

#include "cli/report.hpp"
#include "core/conflict_extractor.hpp"
#include "git/git_repository.hpp"
#include "merge/merge_orchestrator.hpp"
#include "support/scripted_completion_service.hpp"
#include "support/temp_git_repo.hpp"

#include <QTemporaryDir>

#include <chrono>

using namespace mend;
using mend::git::GitRepository;
using mend::testing::TempGitRepo;

namespace {

// main and feature both edit the middle line of f.txt.
void make_conflicting_branches(TempGitRepo& t) {
    t.write("f.txt", "line1\nbase\nline3\n");
    t.commit("Initial commit");
    t.branch("feature");

    t.write("f.txt", "line1\nours\nline3\n");
    t.commit("Change on main");

    t.checkout("feature");
    t.write("f.txt", "line1\ntheirs\nline3\n");
    t.commit("Change on feature");

    t.checkout("main");
}

// Forwards to a real repository but refuses to write one path.
class WriteRefusingRepository final : public MergeRepository {
public:
    WriteRefusingRepository(GitRepository& inner, std::string refused)
        : inner_(inner), refused_(std::move(refused)) {}

    Result<bool, Error> branch_exists(const std::string& name) override { return inner_.branch_exists(name); }
    Result<MergeOutcome, Error> attempt_merge(const std::string& target, const std::string& source) override {
        return inner_.attempt_merge(target, source);
    }
    Result<std::string, Error> read_file(const std::string& path) override { return inner_.read_file(path); }
    Status write_resolved(const std::string& path, const std::string& content) override {
        if (path == refused_) {
            return Status::err(Error{"cannot write '" + path + "': disk full", ErrorKind::Repository});
        }
        return inner_.write_resolved(path, content);
    }
    Status abort_merge() override { return inner_.abort_merge(); }
    Status finalize_stage() override { return inner_.finalize_stage(); }

private:
    GitRepository& inner_;
    std::string refused_;
};

std::unique_ptr<GitRepository> open_repo(const TempGitRepo& t) {
    auto opened = GitRepository::open(t.path());
    REQUIRE(opened.is_ok());
    return std::move(opened).unwrap();
}

} // namespace

TEST_CASE("GitRepository: open fails outside a repository", "[integration][git]") {
    QTemporaryDir dir;
    auto opened = GitRepository::open(dir.path().toStdString());
    REQUIRE(opened.is_err());
    CHECK(opened.unwrap_err().kind == ErrorKind::Repository);
}

TEST_CASE("GitRepository: branch_exists", "[integration][git]") {
    TempGitRepo t;
    t.write("a.txt", "a\n");
    t.commit("Initial commit");
    t.branch("feature");

    auto repo = open_repo(t);
    CHECK(repo->branch_exists("main").unwrap());
    CHECK(repo->branch_exists("feature").unwrap());
    CHECK_FALSE(repo->branch_exists("missing").unwrap());
}

TEST_CASE("GitRepository: conflicting merge leaves markers and abort restores", "[integration][git]") {
    TempGitRepo t;
    make_conflicting_branches(t);
    auto repo = open_repo(t);

    auto merged = repo->attempt_merge("main", "feature");
    REQUIRE(merged.is_ok());
    REQUIRE(merged.unwrap().has_conflicts());
    CHECK(merged.unwrap().conflicted_files == std::vector<std::string>{"f.txt"});
    CHECK(merged.unwrap().non_textual_files.empty());
    CHECK(repo->merge_in_progress());

    auto content = repo->read_file("f.txt");
    REQUIRE(content.is_ok());
    auto regions = extract_conflicts("f.txt", content.unwrap());
    REQUIRE(regions.is_ok());
    REQUIRE(regions.unwrap().size() == 1);
    CHECK(regions.unwrap()[0].ours_text == "ours\n");
    CHECK(regions.unwrap()[0].theirs_text == "theirs\n");

    REQUIRE(repo->abort_merge().is_ok());
    CHECK_FALSE(repo->merge_in_progress());
    CHECK(t.read("f.txt") == QByteArray("line1\nours\nline3\n"));
}

TEST_CASE("GitRepository: resolved file is staged and the merge kept for review", "[integration][git]") {
    TempGitRepo t;
    make_conflicting_branches(t);
    auto repo = open_repo(t);
    REQUIRE(repo->attempt_merge("main", "feature").unwrap().has_conflicts());

    REQUIRE(repo->write_resolved("f.txt", "line1\nours and theirs\nline3\n").is_ok());
    REQUIRE(repo->finalize_stage().is_ok());

    CHECK(repo->merge_in_progress());
    CHECK(t.read("f.txt") == QByteArray("line1\nours and theirs\nline3\n"));

    git_index* index = nullptr;
    REQUIRE(git_repository_index(&index, repo->handle()) == 0);
    REQUIRE(git_index_read(index, 1) == 0);
    CHECK_FALSE(git_index_has_conflicts(index));
    git_index_free(index);
}

TEST_CASE("GitRepository: finalize refuses while conflicts remain", "[integration][git]") {
    TempGitRepo t;
    make_conflicting_branches(t);
    auto repo = open_repo(t);
    REQUIRE(repo->attempt_merge("main", "feature").unwrap().has_conflicts());

    auto finalized = repo->finalize_stage();
    REQUIRE(finalized.is_err());
    CHECK(finalized.unwrap_err().kind == ErrorKind::Repository);
}

TEST_CASE("GitRepository: diverged branches without overlap merge cleanly", "[integration][git]") {
    TempGitRepo t;
    t.write("f.txt", "base\n");
    t.commit("Initial commit");
    t.branch("feature");
    t.write("f.txt", "changed on main\n");
    t.commit("Main change");
    t.checkout("feature");
    t.write("g.txt", "new on feature\n");
    t.commit("Feature file");
    t.checkout("main");

    auto repo = open_repo(t);
    auto merged = repo->attempt_merge("main", "feature");
    REQUIRE(merged.is_ok());
    CHECK(merged.unwrap().kind == MergeOutcome::Kind::Clean);
    CHECK_FALSE(repo->merge_in_progress());
    CHECK(t.read("g.txt") == QByteArray("new on feature\n"));

    git_object* head = nullptr;
    REQUIRE(git_revparse_single(&head, repo->handle(), "HEAD^{commit}") == 0);
    const auto* commit = reinterpret_cast<const git_commit*>(head);
    CHECK(git_commit_parentcount(commit) == 2);
    CHECK(std::string(git_commit_message(commit)) == "Merge branch 'feature' into 'main'");
    git_object_free(head);
}

TEST_CASE("GitRepository: failed merge commit leaves no merge in progress", "[integration][git]") {
    TempGitRepo t;
    t.write("f.txt", "base\n");
    t.commit("Initial commit");
    t.branch("feature");
    t.write("f.txt", "changed on main\n");
    const auto main_tip = t.commit("Main change");
    t.checkout("feature");
    t.write("g.txt", "new on feature\n");
    t.commit("Feature file");
    t.checkout("main");
    if (!t.clear_identity()) {
        WARN("a user identity is configured outside the repository; skipping");
        return;
    }

    auto repo = open_repo(t);
    auto merged = repo->attempt_merge("main", "feature");
    REQUIRE(merged.is_err());
    CHECK(merged.unwrap_err().kind == ErrorKind::Repository);
    CHECK(merged.unwrap_err().message.find("user.name") != std::string::npos);

    CHECK_FALSE(repo->merge_in_progress());
    CHECK(t.read("g.txt").isEmpty());
    CHECK(t.read("f.txt") == QByteArray("changed on main\n"));
    const auto tip = t.branch_tip("main");
    CHECK(git_oid_equal(&tip, &main_tip));

    auto again = repo->attempt_merge("main", "feature");
    REQUIRE(again.is_err());
    CHECK(again.unwrap_err().message.find("in progress") == std::string::npos);
}

TEST_CASE("GitRepository: fast-forward and up-to-date merges", "[integration][git]") {
    TempGitRepo t;
    t.write("f.txt", "base\n");
    t.commit("Initial commit");
    t.branch("feature");
    t.checkout("feature");
    t.write("f.txt", "ahead\n");
    const auto feature_tip = t.commit("Feature work");
    t.checkout("main");

    auto repo = open_repo(t);
    auto forwarded = repo->attempt_merge("main", "feature");
    REQUIRE(forwarded.is_ok());
    CHECK(forwarded.unwrap().kind == MergeOutcome::Kind::FastForward);
    const auto main_tip = t.branch_tip("main");
    CHECK(git_oid_equal(&main_tip, &feature_tip));
    CHECK(t.read("f.txt") == QByteArray("ahead\n"));

    auto again = repo->attempt_merge("main", "feature");
    REQUIRE(again.is_ok());
    CHECK(again.unwrap().kind == MergeOutcome::Kind::UpToDate);
}

TEST_CASE("GitRepository: binary conflicts are marked non-textual", "[integration][git]") {
    TempGitRepo t;
    t.write("logo.bin", QByteArray("\x00\x01\x02" "base", 7));
    t.commit("Initial commit");
    t.branch("feature");
    t.write("logo.bin", QByteArray("\x00\x01\x02ours", 7));
    t.commit("Main logo");
    t.checkout("feature");
    t.write("logo.bin", QByteArray("\x00\x01\x02thrs", 7));
    t.commit("Feature logo");
    t.checkout("main");

    auto repo = open_repo(t);
    auto merged = repo->attempt_merge("main", "feature");
    REQUIRE(merged.is_ok());
    REQUIRE(merged.unwrap().has_conflicts());
    CHECK(merged.unwrap().is_non_textual("logo.bin"));
    REQUIRE(repo->abort_merge().is_ok());
}

TEST_CASE("GitRepository: list_unique_commits newest first", "[integration][git]") {
    TempGitRepo t;
    t.write("base.txt", "base\n");
    t.commit("Initial commit");
    t.branch("feature");

    t.checkout("feature");
    t.write("feature1.txt", "1\n");
    t.commit("Add feature1");
    t.write("feature2.txt", "2\n");
    t.commit("Add feature2");

    t.checkout("main");
    t.write("main1.txt", "m\n");
    t.commit("Add main1");

    auto repo = open_repo(t);

    auto feature_unique = repo->list_unique_commits("feature", "main");
    REQUIRE(feature_unique.is_ok());
    REQUIRE(feature_unique.unwrap().size() == 2);
    CHECK(feature_unique.unwrap()[0].summary == "Add feature2");
    CHECK(feature_unique.unwrap()[1].summary == "Add feature1");
    CHECK(feature_unique.unwrap()[0].id.size() == 40);

    auto main_unique = repo->list_unique_commits("main", "feature");
    REQUIRE(main_unique.is_ok());
    REQUIRE(main_unique.unwrap().size() == 1);
    CHECK(main_unique.unwrap()[0].summary == "Add main1");

    auto none = repo->list_unique_commits("main", "main");
    REQUIRE(none.is_ok());
    CHECK(none.unwrap().empty());

    CHECK(repo->list_unique_commits("main", "missing").is_err());
}

TEST_CASE("Merge pipeline on a real repository", "[integration][git][orchestrator]") {
    TempGitRepo t;
    make_conflicting_branches(t);
    auto repo = open_repo(t);

    mend::testing::ScriptedCompletionService service;
    Settings settings;
    settings.api_key = "sk-test";
    ai::ResolutionClient client(service, settings, [](std::chrono::milliseconds) {});
    MergeOrchestrator orchestrator(*repo, client, settings);

    SECTION("a good answer is staged for review") {
        service.push(mend::testing::reply("```\nours and theirs\n```"));

        const auto session = orchestrator.run("main", "feature");
        CHECK(session.state == MergeState::Committed);
        CHECK(t.read("f.txt") == QByteArray("line1\nours and theirs\nline3\n"));
        CHECK(repo->merge_in_progress());
    }
    SECTION("a rejected answer restores the branch") {
        service.push(mend::testing::reply("```\n<<<<<<< HEAD\nstill conflicted\n```"));

        const auto session = orchestrator.run("main", "feature");
        CHECK(session.state == MergeState::Aborted);
        CHECK_FALSE(repo->merge_in_progress());
        CHECK(t.read("f.txt") == QByteArray("line1\nours\nline3\n"));
    }
}

TEST_CASE("Merge pipeline restores files written before a write failure", "[integration][git][orchestrator]") {
    TempGitRepo t;
    t.write("a.txt", "one\nbase\n");
    t.write("b.txt", "two\nbase\n");
    t.commit("Initial commit");
    t.branch("feature");
    t.write("a.txt", "one\nours\n");
    t.write("b.txt", "two\nours\n");
    t.commit("Change on main");
    t.checkout("feature");
    t.write("a.txt", "one\ntheirs\n");
    t.write("b.txt", "two\ntheirs\n");
    t.commit("Change on feature");
    t.checkout("main");

    auto repo = open_repo(t);
    WriteRefusingRepository refusing(*repo, "b.txt");

    mend::testing::ScriptedCompletionService service;
    service.push(mend::testing::reply("```\nmerged a\n```"));
    service.push(mend::testing::reply("```\nmerged b\n```"));
    Settings settings;
    settings.api_key = "sk-test";
    ai::ResolutionClient client(service, settings, [](std::chrono::milliseconds) {});
    MergeOrchestrator orchestrator(refusing, client, settings);

    const auto session = orchestrator.run("main", "feature");
    REQUIRE(session.fatal_error.has_value());
    CHECK(session.fatal_error->message == "cannot write 'b.txt': disk full");
    CHECK(session.state == MergeState::Aborted);
    CHECK(session.exit_code() == 1);

    CHECK_FALSE(repo->merge_in_progress());
    CHECK(t.read("a.txt") == QByteArray("one\nours\n"));
    CHECK(t.read("b.txt") == QByteArray("two\nours\n"));

    const auto report = cli::format_merge_report(session);
    CHECK(report.contains(QStringLiteral("Error: cannot write 'b.txt': disk full")));
    CHECK(report.contains(QStringLiteral("working tree restored")));
}
