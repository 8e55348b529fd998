#pragma once

#include "core/merge_repository.hpp"
#include "core/result.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mend {

enum class MergeState {
    Idle,
    MergeAttempted,
    ConflictsDetected,
    ResolvingConflicts,
    AllResolved,
    PartiallyResolved,
    ResolutionFailed,
    Committed,
    Aborted
};

[[nodiscard]] constexpr std::string_view to_string(MergeState state) noexcept {
    switch (state) {
        case MergeState::Idle: return "Idle";
        case MergeState::MergeAttempted: return "MergeAttempted";
        case MergeState::ConflictsDetected: return "ConflictsDetected";
        case MergeState::ResolvingConflicts: return "ResolvingConflicts";
        case MergeState::AllResolved: return "AllResolved";
        case MergeState::PartiallyResolved: return "PartiallyResolved";
        case MergeState::ResolutionFailed: return "ResolutionFailed";
        case MergeState::Committed: return "Committed";
        case MergeState::Aborted: return "Aborted";
    }
    return "Unknown";
}

enum class FileOutcome {
    AllSucceeded,
    Partial,
    Failed
};

struct RegionReport {
    size_t start_line = 0;  // zero-based, marker lines included
    size_t end_line = 0;
    int attempts = 0;
    bool succeeded = false;
    bool low_confidence = false;
    std::string reason;  // failure message when !succeeded
};

/**
 * FileReport - What happened to one conflicted file.
 *
 * `error` carries a file-level failure (malformed markers, a conflict with
 * nothing to resolve textually); region-level failures live in `regions`.
 */
struct FileReport {
    std::string path;
    FileOutcome outcome = FileOutcome::Failed;
    std::vector<RegionReport> regions;
    std::optional<Error> error;

    [[nodiscard]] size_t succeeded_regions() const {
        return static_cast<size_t>(std::count_if(regions.begin(), regions.end(),
                                                 [](const RegionReport& r) { return r.succeeded; }));
    }
};

/**
 * MergeSession - Everything one `merge` invocation did, in order.
 *
 * Owned by the orchestrator while it runs and handed to the caller for
 * reporting afterwards.
 */
struct MergeSession {
    std::string target_branch;
    std::string source_branch;

    MergeState state = MergeState::Idle;
    std::vector<MergeState> trail{MergeState::Idle};

    MergeOutcome::Kind merge_kind = MergeOutcome::Kind::Clean;
    std::vector<std::string> conflicted_files;
    std::vector<FileReport> files;

    // Set when the run stopped early (repository failure, credentials,
    // missing API key).
    std::optional<Error> fatal_error;

    void transition(MergeState next) {
        state = next;
        trail.push_back(next);
    }

    [[nodiscard]] bool all_files_succeeded() const {
        return std::all_of(files.begin(), files.end(),
                           [](const FileReport& f) { return f.outcome == FileOutcome::AllSucceeded; });
    }

    [[nodiscard]] bool any_region_succeeded() const {
        return std::any_of(files.begin(), files.end(),
                           [](const FileReport& f) { return f.succeeded_regions() > 0; });
    }

    [[nodiscard]] bool credentials_failed() const {
        return fatal_error && fatal_error->kind == ErrorKind::Credentials;
    }

    [[nodiscard]] int exit_code() const {
        return state == MergeState::Committed && !fatal_error ? 0 : 1;
    }
};

} // namespace mend
