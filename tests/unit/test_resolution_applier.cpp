#include <catch2/catch_test_macros.hpp>

#include "core/conflict_extractor.hpp"
#include "core/resolution_applier.hpp"
#include "support/fake_merge_repository.hpp"

#include <string>
#include <vector>

using namespace mend;
using mend::testing::FakeMergeRepository;

namespace {

const std::string kThreeRegions =
    "top\n"
    "<<<<<<< HEAD\n"
    "a1\n"
    "=======\n"
    "a2\n"
    ">>>>>>> feature\n"
    "between\n"
    "<<<<<<< HEAD\n"
    "b1\n"
    "=======\n"
    "b2\n"
    ">>>>>>> feature\n"
    "<<<<<<< HEAD\n"
    "c1\n"
    "=======\n"
    "c2\n"
    ">>>>>>> feature\n"
    "bottom\n";

std::vector<ResolutionAttempt> attempts_for(const std::string& content) {
    std::vector<ResolutionAttempt> out;
    for (auto& region : extract_conflicts("f.txt", content).unwrap()) {
        out.emplace_back(std::move(region));
    }
    return out;
}

} // namespace

TEST_CASE("validate_candidate: accepts ordinary text", "[unit][applier]") {
    REQUIRE(validate_candidate("int x = 1;\n").is_ok());
    REQUIRE(validate_candidate("a ====== b || c\n").is_ok());
}

TEST_CASE("validate_candidate: rejects empty and marker-bearing candidates", "[unit][applier]") {
    auto blank = validate_candidate("  \n\t\n");
    REQUIRE(blank.is_err());
    CHECK(blank.unwrap_err().kind == ErrorKind::Validation);
    CHECK(blank.unwrap_err().message == "invalid candidate: empty resolution");

    CHECK(validate_candidate("x\n<<<<<<< HEAD\n").is_err());
    CHECK(validate_candidate("x // >>>>>>> left over\n").is_err());
    CHECK(validate_candidate("x\n=======\ny\n").is_err());
    CHECK(validate_candidate("|||||||\n").is_err());
    CHECK(validate_candidate("x = \"=======\";\n").is_err());
    CHECK(validate_candidate("// ======= section\n").is_err());
    CHECK(validate_candidate("a ||||||| b\n").is_err());
    CHECK(validate_candidate("v = 1 ======= 2").is_err());
    CHECK(validate_candidate("x\n=======\ny\n").unwrap_err().message ==
          "invalid candidate: contains conflict markers");
}

TEST_CASE("splice_resolutions: replaces regions with shifting offsets", "[unit][applier]") {
    auto attempts = attempts_for(kThreeRegions);
    REQUIRE(attempts.size() == 3);
    attempts[0].succeed("a1\na2\nextra\n", false);  // grows by two lines
    attempts[1].succeed("b", false);                 // newline gets appended
    attempts[2].succeed("c1\n", false);

    auto spliced = splice_resolutions(kThreeRegions, attempts);
    REQUIRE(spliced.is_ok());
    CHECK(spliced.unwrap() == "top\na1\na2\nextra\nbetween\nb\nc1\nbottom\n");
    CHECK_FALSE(has_conflict_markers(spliced.unwrap()));
}

TEST_CASE("splice_resolutions: keeps CRLF style after the region", "[unit][applier]") {
    const std::string content = "x\r\n<<<<<<< HEAD\r\no\r\n=======\r\nt\r\n>>>>>>> b\r\ny\r\n";
    auto attempts = attempts_for(content);
    attempts[0].succeed("merged", false);

    auto spliced = splice_resolutions(content, attempts);
    REQUIRE(spliced.is_ok());
    CHECK(spliced.unwrap() == "x\r\nmerged\r\ny\r\n");
}

TEST_CASE("splice_resolutions: refuses a span that changed", "[unit][applier]") {
    auto attempts = attempts_for(kThreeRegions);
    for (auto& a : attempts) a.succeed("ok\n", false);

    auto edited = kThreeRegions;
    edited.replace(edited.find("a1"), 2, "zz");
    auto spliced = splice_resolutions(edited, attempts);
    REQUIRE(spliced.is_err());
    CHECK(spliced.unwrap_err().kind == ErrorKind::Validation);
}

TEST_CASE("ResolutionApplier: writes when every region succeeded", "[unit][applier]") {
    FakeMergeRepository repo;
    repo.files["f.txt"] = kThreeRegions;
    ResolutionApplier applier(repo);

    auto attempts = attempts_for(kThreeRegions);
    for (auto& a : attempts) a.succeed("resolved\n", false);

    auto written = applier.apply_file("f.txt", kThreeRegions, attempts);
    REQUIRE(written.is_ok());
    REQUIRE(written.unwrap());
    CHECK(repo.write_calls == 1);
    CHECK(repo.files["f.txt"] == "top\nresolved\nbetween\nresolved\nresolved\nbottom\n");
    CHECK(repo.staged == std::vector<std::string>{"f.txt"});
}

TEST_CASE("ResolutionApplier: one failed region of three leaves the file untouched", "[unit][applier]") {
    FakeMergeRepository repo;
    repo.files["f.txt"] = kThreeRegions;
    ResolutionApplier applier(repo);

    auto attempts = attempts_for(kThreeRegions);
    attempts[0].succeed("a\n", false);
    attempts[1].fail(Error{"no resolution after 3 attempt(s): timeout", ErrorKind::Transient});
    attempts[2].succeed("c\n", false);

    auto written = applier.apply_file("f.txt", kThreeRegions, attempts);
    REQUIRE(written.is_ok());
    REQUIRE_FALSE(written.unwrap());
    CHECK(repo.write_calls == 0);
    CHECK(repo.files["f.txt"] == kThreeRegions);
}

TEST_CASE("ResolutionApplier: an invalid candidate fails its region", "[unit][applier]") {
    FakeMergeRepository repo;
    repo.files["f.txt"] = kThreeRegions;
    ResolutionApplier applier(repo);

    auto attempts = attempts_for(kThreeRegions);
    attempts[0].succeed("a\n", false);
    attempts[1].succeed("<<<<<<< HEAD\nb\n", false);
    attempts[2].succeed("c\n", false);

    auto written = applier.apply_file("f.txt", kThreeRegions, attempts);
    REQUIRE(written.is_ok());
    REQUIRE_FALSE(written.unwrap());
    CHECK(repo.write_calls == 0);
    CHECK(attempts[0].succeeded());
    REQUIRE(attempts[1].failed());
    CHECK(attempts[1].failure->kind == ErrorKind::Validation);
    CHECK(attempts[1].resolved_text.empty());
}

TEST_CASE("ResolutionApplier: repository write errors propagate", "[unit][applier]") {
    FakeMergeRepository repo;
    repo.write_error = Error{"disk full", ErrorKind::Repository};
    ResolutionApplier applier(repo);

    auto attempts = attempts_for(kThreeRegions);
    for (auto& a : attempts) a.succeed("x\n", false);

    auto written = applier.apply_file("f.txt", kThreeRegions, attempts);
    REQUIRE(written.is_err());
    CHECK(written.unwrap_err().kind == ErrorKind::Repository);
}

TEST_CASE("ResolutionAttempt: terminal states are final", "[unit][applier]") {
    ResolutionAttempt attempt;
    attempt.succeed("x\n", true);
    attempt.fail(Error{"late", ErrorKind::Transient});
    CHECK(attempt.succeeded());
    CHECK(attempt.low_confidence);
    CHECK_FALSE(attempt.failure.has_value());
}
