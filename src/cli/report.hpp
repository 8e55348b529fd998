#pragma once

#include "git/git_repository.hpp"
#include "merge/merge_session.hpp"

#include <QString>

#include <string>
#include <vector>

namespace mend::cli {

// Human-readable summary of a merge run, one line per file and region.
[[nodiscard]] QString format_merge_report(const MergeSession& session);

// Output of `list-unique`.
[[nodiscard]] QString format_unique_commits(const std::string& target,
                                            const std::string& source,
                                            const std::vector<git::CommitSummary>& commits);

} // namespace mend::cli
