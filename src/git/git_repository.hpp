#pragma once

#include "core/merge_repository.hpp"
#include "core/result.hpp"

#include <git2.h>

#include <memory>
#include <string>
#include <vector>

namespace mend::git {

/**
 * Keeps libgit2 initialised for the lifetime of the object. Nested guards
 * are reference counted by libgit2 itself.
 */
class LibGit2Runtime {
public:
    LibGit2Runtime() { git_libgit2_init(); }
    ~LibGit2Runtime() { git_libgit2_shutdown(); }

    LibGit2Runtime(const LibGit2Runtime&) = delete;
    LibGit2Runtime& operator=(const LibGit2Runtime&) = delete;
};

/**
 * CommitSummary - One line of `list-unique` output.
 */
struct CommitSummary {
    std::string id;       // full hex object id
    std::string summary;  // first paragraph of the message
};

/**
 * GitRepository - MergeRepository on top of a libgit2 repository handle.
 *
 * attempt_merge() checks out the target branch (refusing to clobber local
 * changes), analyses the merge with the source branch and then:
 * - up to date: does nothing;
 * - fast-forward: moves the target branch to the source commit;
 * - normal: merges; without conflicts a merge commit is created, otherwise
 *   the merge is left in progress with conflict markers in the working tree.
 * A failure after the merge has touched the index and working tree resets
 * them to HEAD, so no half-done merge is left behind.
 */
class GitRepository final : public MergeRepository {
public:
    ~GitRepository() override;

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    /**
     * Open the repository containing `path` (searching parent directories).
     */
    [[nodiscard]] static Result<std::unique_ptr<GitRepository>, Error> open(const std::string& path);

    [[nodiscard]] Result<bool, Error> branch_exists(const std::string& name) override;
    [[nodiscard]] Result<MergeOutcome, Error> attempt_merge(const std::string& target,
                                                            const std::string& source) override;
    [[nodiscard]] Result<std::string, Error> read_file(const std::string& path) override;
    [[nodiscard]] Status write_resolved(const std::string& path, const std::string& content) override;
    [[nodiscard]] Status abort_merge() override;
    [[nodiscard]] Status finalize_stage() override;

    /**
     * Commits reachable from `target` but not from `source`, newest first.
     */
    [[nodiscard]] Result<std::vector<CommitSummary>, Error> list_unique_commits(const std::string& target,
                                                                                const std::string& source);

    [[nodiscard]] std::string workdir() const;

    // True while a merge is in progress (MERGE_HEAD present).
    [[nodiscard]] bool merge_in_progress() const;

    [[nodiscard]] git_repository* handle() const { return repo_; }

private:
    explicit GitRepository(git_repository* repo) : repo_(repo) {}

    [[nodiscard]] Result<git_oid, Error> branch_commit(const std::string& name);
    [[nodiscard]] Status checkout_branch(const std::string& name);
    [[nodiscard]] Status fast_forward(const std::string& target, const git_oid& to);
    [[nodiscard]] Status create_merge_commit(const std::string& target, const std::string& source,
                                             const git_oid& source_oid);
    [[nodiscard]] Result<MergeOutcome, Error> collect_conflicts();
    [[nodiscard]] Error roll_back(Error cause);

    LibGit2Runtime runtime_;
    git_repository* repo_ = nullptr;
};

} // namespace mend::git
