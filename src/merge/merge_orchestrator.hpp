#pragma once

#include "ai/resolution_client.hpp"
#include "config/settings.hpp"
#include "core/merge_repository.hpp"
#include "core/resolution_applier.hpp"
#include "merge/merge_session.hpp"

#include <string>

namespace mend {

/**
 * MergeOrchestrator - Drives one merge from attempt to commit or abort.
 *
 * Files are processed in the order the merge reported them and regions top to
 * bottom. The merge is left staged for review only when every conflicted
 * file was fully resolved; any other outcome restores the pre-merge state.
 */
class MergeOrchestrator {
public:
    MergeOrchestrator(MergeRepository& repo, ai::ResolutionClient& client, const Settings& settings);

    [[nodiscard]] MergeSession run(const std::string& target, const std::string& source);

private:
    // Returns false when the whole run must stop (fatal_error is set).
    [[nodiscard]] bool resolve_file(MergeSession& session, const MergeOutcome& outcome, const std::string& path);

    [[nodiscard]] bool check_branch(MergeSession& session, const std::string& name);

    // Abort and record the outcome. Keeps an earlier fatal error.
    void abort(MergeSession& session);

    MergeRepository& repo_;
    ai::ResolutionClient& client_;
    const Settings& settings_;
    ResolutionApplier applier_;
};

} // namespace mend
