#pragma once

#include "core/conflict_region.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <utility>

namespace mend {

enum class AttemptStatus {
    Pending,
    Succeeded,
    Failed
};

/**
 * ResolutionAttempt - The answer (or lack of one) for a single region.
 *
 * Mutated in place across retries. Once Succeeded or Failed it is terminal:
 * succeed()/fail() on a terminal attempt are ignored.
 */
struct ResolutionAttempt {
    ConflictRegion region;
    int attempt_count = 0;
    AttemptStatus status = AttemptStatus::Pending;

    std::string resolved_text;     // valid when Succeeded
    std::optional<Error> failure;  // set when Failed
    bool low_confidence = false;   // candidate was not taken from a code block

    ResolutionAttempt() = default;
    explicit ResolutionAttempt(ConflictRegion r) : region(std::move(r)) {}

    [[nodiscard]] bool is_terminal() const { return status != AttemptStatus::Pending; }
    [[nodiscard]] bool succeeded() const { return status == AttemptStatus::Succeeded; }
    [[nodiscard]] bool failed() const { return status == AttemptStatus::Failed; }

    void succeed(std::string text, bool low_conf) {
        if (is_terminal()) return;
        resolved_text = std::move(text);
        low_confidence = low_conf;
        status = AttemptStatus::Succeeded;
    }

    void fail(Error error) {
        if (is_terminal()) return;
        failure = std::move(error);
        status = AttemptStatus::Failed;
    }

    // Used by the applier to reject an already accepted candidate.
    void reject(Error error) {
        failure = std::move(error);
        resolved_text.clear();
        status = AttemptStatus::Failed;
    }
};

} // namespace mend
