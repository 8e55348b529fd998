#include <catch2/catch_test_macros.hpp>

#include "ai/resolution_client.hpp"
#include "core/conflict_extractor.hpp"
#include "support/scripted_completion_service.hpp"

#include <chrono>
#include <vector>

using namespace mend;
using namespace mend::ai;
using mend::testing::ScriptedCompletionService;
using mend::testing::failure;
using mend::testing::reply;

namespace {

ConflictRegion sample_region() {
    return extract_conflicts("a.txt", "<<<<<<< HEAD\nx = 1\n=======\nx = 2\n>>>>>>> feature\n").unwrap().at(0);
}

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;

    Sleeper fn() {
        return [this](std::chrono::milliseconds d) { delays.push_back(d); };
    }
};

Settings settings_with(int max_retries, int delay_ms = 1000) {
    Settings s;
    s.api_key = "test-key";
    s.max_retries = max_retries;
    s.retry_delay_ms = delay_ms;
    s.model = "test-model";
    s.temperature = 0.2;
    s.timeout_seconds = 7;
    return s;
}

} // namespace

TEST_CASE("ResolutionClient: first good reply succeeds", "[unit][client]") {
    ScriptedCompletionService service;
    service.push(reply("```\nx = 3\n```"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(3);
    ResolutionClient client(service, settings, sleeper.fn());

    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.succeeded());
    CHECK(attempt.resolved_text == "x = 3\n");
    CHECK(attempt.attempt_count == 1);
    CHECK_FALSE(attempt.low_confidence);
    CHECK(sleeper.delays.empty());

    REQUIRE(service.calls() == 1);
    const auto& request = service.requests[0];
    CHECK(request.system_prompt == kSystemPrompt);
    CHECK(request.model == "test-model");
    CHECK(request.temperature == 0.2);
    CHECK(request.timeout == std::chrono::seconds{7});
    CHECK(request.user_prompt.find("x = 2") != std::string::npos);
}

TEST_CASE("ResolutionClient: transient failures are retried with backoff", "[unit][client]") {
    ScriptedCompletionService service;
    service.push(failure(ErrorKind::Transient, "HTTP 503"));
    service.push(failure(ErrorKind::Transient, "timeout"));
    service.push(reply("x = 3"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(3, 100);
    ResolutionClient client(service, settings, sleeper.fn());

    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.succeeded());
    CHECK(attempt.low_confidence);
    CHECK(attempt.attempt_count == 3);
    CHECK(service.calls() == 3);
    CHECK(sleeper.delays == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds{100},
                                                                    std::chrono::milliseconds{200}});
}

TEST_CASE("ResolutionClient: never exceeds max_retries calls", "[unit][client]") {
    ScriptedCompletionService service;
    for (int i = 0; i < 10; ++i) service.push(failure(ErrorKind::Transient, "HTTP 500"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(4);
    ResolutionClient client(service, settings, sleeper.fn());

    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.failed());
    CHECK(service.calls() == 4);
    CHECK(attempt.attempt_count == 4);
    CHECK(attempt.failure->kind == ErrorKind::Transient);
    CHECK(attempt.failure->message == "no resolution after 4 attempt(s): HTTP 500");
    CHECK(sleeper.delays.size() == 3);
}

TEST_CASE("ResolutionClient: permanent failure makes exactly one call", "[unit][client]") {
    ScriptedCompletionService service;
    service.push(failure(ErrorKind::Permanent, "HTTP 400"));
    service.push(reply("x = 3"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(3);
    ResolutionClient client(service, settings, sleeper.fn());

    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.failed());
    CHECK(service.calls() == 1);
    CHECK(attempt.failure->kind == ErrorKind::Permanent);
    CHECK(attempt.failure->message == "HTTP 400");
    CHECK(sleeper.delays.empty());
}

TEST_CASE("ResolutionClient: credential failure is not retried", "[unit][client]") {
    ScriptedCompletionService service;
    service.push(failure(ErrorKind::Credentials, "HTTP 401"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(5);
    ResolutionClient client(service, settings, sleeper.fn());

    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.failed());
    CHECK(attempt.failure->kind == ErrorKind::Credentials);
    CHECK(service.calls() == 1);
}

TEST_CASE("ResolutionClient: a zero call budget makes no call", "[unit][client]") {
    ScriptedCompletionService service;
    service.push(reply("```\nx\n```"));
    RecordingSleeper sleeper;
    const auto settings = settings_with(0);
    ResolutionClient client(service, settings, sleeper.fn());

    CHECK(client.max_calls() == 0);
    auto attempt = client.resolve(sample_region(), RegionContext{});
    REQUIRE(attempt.failed());
    CHECK(attempt.failure->kind == ErrorKind::Config);
    CHECK(attempt.attempt_count == 0);
    CHECK(service.calls() == 0);
    CHECK(sleeper.delays.empty());
}

TEST_CASE("ResolutionClient: terminal attempts are left alone", "[unit][client]") {
    ScriptedCompletionService service;
    const auto settings = settings_with(3);
    ResolutionClient client(service, settings, [](std::chrono::milliseconds) {});

    ResolutionAttempt attempt(sample_region());
    attempt.fail(Error{"earlier", ErrorKind::Permanent});
    client.resolve(attempt, RegionContext{});
    CHECK(service.calls() == 0);
    CHECK(attempt.failure->message == "earlier");
}

TEST_CASE("ResolutionClient: backoff doubles and is capped", "[unit][client]") {
    ScriptedCompletionService service;
    const auto settings = settings_with(10, 1000);
    ResolutionClient client(service, settings, [](std::chrono::milliseconds) {});

    CHECK(client.backoff_after(0) == std::chrono::milliseconds{0});
    CHECK(client.backoff_after(1) == std::chrono::milliseconds{1000});
    CHECK(client.backoff_after(2) == std::chrono::milliseconds{2000});
    CHECK(client.backoff_after(3) == std::chrono::milliseconds{4000});
    CHECK(client.backoff_after(4) == ResolutionClient::kMaxBackoff);
    CHECK(client.backoff_after(9) == ResolutionClient::kMaxBackoff);
}
