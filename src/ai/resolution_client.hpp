#pragma once

#include "ai/completion_service.hpp"
#include "ai/prompt.hpp"
#include "config/settings.hpp"
#include "core/conflict_region.hpp"
#include "core/resolution_attempt.hpp"

#include <chrono>
#include <functional>

namespace mend::ai {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Blocks the calling thread.
[[nodiscard]] Sleeper thread_sleeper();

/**
 * ResolutionClient - Turns a conflict region into a candidate resolution.
 *
 * Makes at most max(1, settings.max_retries) calls per region. Transient
 * failures are retried after an exponential backoff; Permanent and
 * Credentials failures end the attempt immediately.
 */
class ResolutionClient {
public:
    static constexpr std::chrono::milliseconds kMaxBackoff{8000};

    ResolutionClient(CompletionService& service, const Settings& settings, Sleeper sleeper = thread_sleeper());

    /**
     * Drive `attempt` to a terminal state. Attempts that are already
     * terminal are left alone.
     */
    void resolve(ResolutionAttempt& attempt, const RegionContext& context);

    [[nodiscard]] ResolutionAttempt resolve(const ConflictRegion& region, const RegionContext& context);

    [[nodiscard]] int max_calls() const;

    // Delay before the next call after `failed_calls` transient failures.
    [[nodiscard]] std::chrono::milliseconds backoff_after(int failed_calls) const;

private:
    [[nodiscard]] CompletionRequest make_request(const ConflictRegion& region, const RegionContext& context) const;

    CompletionService& service_;
    const Settings& settings_;
    Sleeper sleep_;
};

} // namespace mend::ai
