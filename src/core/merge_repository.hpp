#pragma once

#include "core/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mend {

/**
 * MergeOutcome - What the underlying merge operation did.
 */
struct MergeOutcome {
    enum class Kind {
        Clean,        // merged and committed without conflicts
        FastForward,  // target moved to source
        UpToDate,     // nothing to merge
        Conflicted    // merge in progress, conflicted_files need resolving
    };

    Kind kind{Kind::Clean};
    // Conflicted paths in index order, including non-textual ones.
    std::vector<std::string> conflicted_files;
    // Subset with no markers to resolve (modify/delete, binary).
    std::vector<std::string> non_textual_files;

    [[nodiscard]] bool has_conflicts() const { return kind == Kind::Conflicted; }

    [[nodiscard]] bool is_non_textual(const std::string& path) const {
        for (const auto& p : non_textual_files) {
            if (p == path) return true;
        }
        return false;
    }

    static MergeOutcome clean() { return MergeOutcome{Kind::Clean, {}, {}}; }
    static MergeOutcome conflicted(std::vector<std::string> files) {
        return MergeOutcome{Kind::Conflicted, std::move(files), {}};
    }
};

/**
 * MergeRepository - The repository operations the merge pipeline needs.
 *
 * Implemented on top of libgit2 by git::GitRepository; tests substitute an
 * in-memory fake. All failures are reported as ErrorKind::Repository.
 */
class MergeRepository {
public:
    virtual ~MergeRepository() = default;

    [[nodiscard]] virtual Result<bool, Error> branch_exists(const std::string& name) = 0;

    [[nodiscard]] virtual Result<MergeOutcome, Error> attempt_merge(const std::string& target,
                                                                    const std::string& source) = 0;

    // Working-tree content of a path relative to the repository root.
    [[nodiscard]] virtual Result<std::string, Error> read_file(const std::string& path) = 0;

    // Write a resolved file and stage it.
    [[nodiscard]] virtual Status write_resolved(const std::string& path, const std::string& content) = 0;

    // Restore working tree and index to their pre-merge state.
    [[nodiscard]] virtual Status abort_merge() = 0;

    // Persist the staged resolutions, leaving the merge for the user to commit.
    [[nodiscard]] virtual Status finalize_stage() = 0;
};

} // namespace mend
