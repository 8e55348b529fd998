#include "git/git_repository.hpp"

#include "logging/logging.hpp"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QString>

namespace mend::git {
namespace {

using ReferencePtr = std::unique_ptr<git_reference, decltype(&git_reference_free)>;
using ObjectPtr = std::unique_ptr<git_object, decltype(&git_object_free)>;
using CommitPtr = std::unique_ptr<git_commit, decltype(&git_commit_free)>;
using AnnotatedPtr = std::unique_ptr<git_annotated_commit, decltype(&git_annotated_commit_free)>;
using IndexPtr = std::unique_ptr<git_index, decltype(&git_index_free)>;
using TreePtr = std::unique_ptr<git_tree, decltype(&git_tree_free)>;
using SignaturePtr = std::unique_ptr<git_signature, decltype(&git_signature_free)>;
using RevwalkPtr = std::unique_ptr<git_revwalk, decltype(&git_revwalk_free)>;
using BlobPtr = std::unique_ptr<git_blob, decltype(&git_blob_free)>;
using ConflictIteratorPtr =
    std::unique_ptr<git_index_conflict_iterator, decltype(&git_index_conflict_iterator_free)>;

Error git_failure(const std::string& what) {
    std::string message = what;
    const git_error* last = git_error_last();
    if (last && last->message) {
        message += ": ";
        message += last->message;
    }
    return Error{message, ErrorKind::Repository};
}

std::string oid_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1] = {};
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

Result<IndexPtr, Error> open_index(git_repository* repo) {
    git_index* raw = nullptr;
    if (git_repository_index(&raw, repo) != 0) {
        return Result<IndexPtr, Error>::err(git_failure("cannot open index"));
    }
    return Result<IndexPtr, Error>::ok(IndexPtr(raw, &git_index_free));
}

Result<CommitPtr, Error> head_commit(git_repository* repo) {
    git_object* raw = nullptr;
    if (git_revparse_single(&raw, repo, "HEAD^{commit}") != 0) {
        return Result<CommitPtr, Error>::err(git_failure("cannot resolve HEAD"));
    }
    return Result<CommitPtr, Error>::ok(
        CommitPtr(reinterpret_cast<git_commit*>(raw), &git_commit_free));
}

bool is_binary_entry(git_repository* repo, const git_index_entry* entry) {
    if (!entry) return false;
    git_blob* raw = nullptr;
    if (git_blob_lookup(&raw, repo, &entry->id) != 0) return false;
    BlobPtr blob(raw, &git_blob_free);
    return git_blob_is_binary(blob.get()) != 0;
}

} // namespace

GitRepository::~GitRepository() {
    if (repo_) {
        git_repository_free(repo_);
        repo_ = nullptr;
    }
}

Result<std::unique_ptr<GitRepository>, Error> GitRepository::open(const std::string& path) {
    using Out = Result<std::unique_ptr<GitRepository>, Error>;

    LibGit2Runtime runtime;
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, path.c_str(), 0, nullptr) != 0) {
        return Out::err(git_failure("cannot open repository at '" + path + "'"));
    }
    if (git_repository_is_bare(raw)) {
        git_repository_free(raw);
        return Out::err(Error{"repository at '" + path + "' has no working directory", ErrorKind::Repository});
    }

    std::unique_ptr<GitRepository> repo(new GitRepository(raw));
    qCInfo(mendGitLog) << "opened repository" << QString::fromStdString(repo->workdir());
    return Out::ok(std::move(repo));
}

std::string GitRepository::workdir() const {
    const char* dir = git_repository_workdir(repo_);
    return dir ? std::string(dir) : std::string{};
}

bool GitRepository::merge_in_progress() const {
    return git_repository_state(repo_) == GIT_REPOSITORY_STATE_MERGE;
}

Result<bool, Error> GitRepository::branch_exists(const std::string& name) {
    git_reference* raw = nullptr;
    const int rc = git_branch_lookup(&raw, repo_, name.c_str(), GIT_BRANCH_LOCAL);
    if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) {
        return Result<bool, Error>::ok(false);
    }
    if (rc != 0) {
        return Result<bool, Error>::err(git_failure("cannot look up branch '" + name + "'"));
    }
    git_reference_free(raw);
    return Result<bool, Error>::ok(true);
}

Result<git_oid, Error> GitRepository::branch_commit(const std::string& name) {
    using Out = Result<git_oid, Error>;

    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, repo_, name.c_str(), GIT_BRANCH_LOCAL) != 0) {
        return Out::err(git_failure("branch '" + name + "' not found"));
    }
    ReferencePtr ref(raw_ref, &git_reference_free);

    git_object* raw_obj = nullptr;
    if (git_reference_peel(&raw_obj, ref.get(), GIT_OBJECT_COMMIT) != 0) {
        return Out::err(git_failure("branch '" + name + "' does not point to a commit"));
    }
    ObjectPtr obj(raw_obj, &git_object_free);
    return Out::ok(*git_object_id(obj.get()));
}

Status GitRepository::checkout_branch(const std::string& name) {
    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, repo_, name.c_str(), GIT_BRANCH_LOCAL) != 0) {
        return Status::err(git_failure("branch '" + name + "' not found"));
    }
    ReferencePtr ref(raw_ref, &git_reference_free);

    git_object* raw_obj = nullptr;
    if (git_reference_peel(&raw_obj, ref.get(), GIT_OBJECT_COMMIT) != 0) {
        return Status::err(git_failure("branch '" + name + "' does not point to a commit"));
    }
    ObjectPtr target(raw_obj, &git_object_free);

    // SAFE: refuse to overwrite uncommitted local changes.
    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(repo_, target.get(), &opts) != 0) {
        return Status::err(git_failure("cannot check out '" + name + "'"));
    }
    if (git_repository_set_head(repo_, git_reference_name(ref.get())) != 0) {
        return Status::err(git_failure("cannot switch HEAD to '" + name + "'"));
    }
    qCInfo(mendGitLog) << "checked out" << QString::fromStdString(name);
    return Status::ok();
}

Result<MergeOutcome, Error> GitRepository::attempt_merge(const std::string& target, const std::string& source) {
    using Out = Result<MergeOutcome, Error>;

    if (git_repository_state(repo_) != GIT_REPOSITORY_STATE_NONE) {
        return Out::err(Error{"another operation (merge, rebase, cherry-pick) is already in progress",
                              ErrorKind::Repository});
    }

    qCInfo(mendGitLog) << "merging" << QString::fromStdString(source)
                       << "into" << QString::fromStdString(target);

    auto checked_out = checkout_branch(target);
    if (checked_out.is_err()) return Out::err(checked_out.unwrap_err());

    auto source_oid = branch_commit(source);
    if (source_oid.is_err()) return Out::err(source_oid.unwrap_err());

    git_annotated_commit* raw_head = nullptr;
    if (git_annotated_commit_lookup(&raw_head, repo_, &source_oid.unwrap()) != 0) {
        return Out::err(git_failure("cannot prepare '" + source + "' for merging"));
    }
    AnnotatedPtr their_head(raw_head, &git_annotated_commit_free);
    const git_annotated_commit* heads[] = {their_head.get()};

    git_merge_analysis_t analysis = GIT_MERGE_ANALYSIS_NONE;
    git_merge_preference_t preference = GIT_MERGE_PREFERENCE_NONE;
    if (git_merge_analysis(&analysis, &preference, repo_, heads, 1) != 0) {
        return Out::err(git_failure("merge analysis failed"));
    }

    if (analysis & GIT_MERGE_ANALYSIS_UP_TO_DATE) {
        qCInfo(mendGitLog) << "already up to date";
        return Out::ok(MergeOutcome{MergeOutcome::Kind::UpToDate, {}, {}});
    }

    if ((analysis & GIT_MERGE_ANALYSIS_FASTFORWARD) && !(preference & GIT_MERGE_PREFERENCE_NO_FASTFORWARD)) {
        auto forwarded = fast_forward(target, source_oid.unwrap());
        if (forwarded.is_err()) return Out::err(forwarded.unwrap_err());
        return Out::ok(MergeOutcome{MergeOutcome::Kind::FastForward, {}, {}});
    }

    if (!(analysis & GIT_MERGE_ANALYSIS_NORMAL)) {
        return Out::err(Error{"unexpected merge analysis result", ErrorKind::Repository});
    }

    git_merge_options merge_opts = GIT_MERGE_OPTIONS_INIT;
    merge_opts.file_favor = GIT_MERGE_FILE_FAVOR_NORMAL;

    git_checkout_options checkout_opts = GIT_CHECKOUT_OPTIONS_INIT;
    checkout_opts.checkout_strategy = GIT_CHECKOUT_SAFE | GIT_CHECKOUT_ALLOW_CONFLICTS;

    if (git_merge(repo_, heads, 1, &merge_opts, &checkout_opts) != 0) {
        return Out::err(git_failure("merge of '" + source + "' into '" + target + "' failed"));
    }

    // From here on the merge is in progress; any failure rolls it back.
    auto outcome = collect_conflicts();
    if (outcome.is_err()) return Out::err(roll_back(outcome.unwrap_err()));
    if (outcome.unwrap().has_conflicts()) {
        qCInfo(mendGitLog) << "merge left" << outcome.unwrap().conflicted_files.size() << "conflicted file(s)";
        return outcome;
    }

    auto committed = create_merge_commit(target, source, source_oid.unwrap());
    if (committed.is_err()) return Out::err(roll_back(committed.unwrap_err()));
    return Out::ok(MergeOutcome::clean());
}

Error GitRepository::roll_back(Error cause) {
    qCWarning(mendGitLog) << "rolling back merge:" << QString::fromStdString(cause.message);
    auto aborted = abort_merge();
    if (aborted.is_err()) {
        cause.message += "; rollback failed: " + aborted.unwrap_err().message;
    }
    return cause;
}

Result<MergeOutcome, Error> GitRepository::collect_conflicts() {
    using Out = Result<MergeOutcome, Error>;

    auto index = open_index(repo_);
    if (index.is_err()) return Out::err(index.unwrap_err());
    git_index* idx = index.unwrap().get();

    if (git_index_read(idx, 1) != 0) {
        return Out::err(git_failure("cannot read index"));
    }

    MergeOutcome outcome;
    if (!git_index_has_conflicts(idx)) {
        return Out::ok(outcome);
    }
    outcome.kind = MergeOutcome::Kind::Conflicted;

    git_index_conflict_iterator* raw_it = nullptr;
    if (git_index_conflict_iterator_new(&raw_it, idx) != 0) {
        return Out::err(git_failure("cannot iterate index conflicts"));
    }
    ConflictIteratorPtr it(raw_it, &git_index_conflict_iterator_free);

    const git_index_entry* ancestor = nullptr;
    const git_index_entry* ours = nullptr;
    const git_index_entry* theirs = nullptr;
    int rc = 0;
    while ((rc = git_index_conflict_next(&ancestor, &ours, &theirs, it.get())) == 0) {
        const git_index_entry* any = ours ? ours : (theirs ? theirs : ancestor);
        const std::string path(any->path);
        outcome.conflicted_files.push_back(path);

        // Only both-sides-present text conflicts carry markers to resolve.
        if (!ours || !theirs || is_binary_entry(repo_, ours) || is_binary_entry(repo_, theirs)) {
            outcome.non_textual_files.push_back(path);
        }
    }
    if (rc != GIT_ITEROVER) {
        return Out::err(git_failure("cannot iterate index conflicts"));
    }
    return Out::ok(std::move(outcome));
}

Status GitRepository::fast_forward(const std::string& target, const git_oid& to) {
    git_object* raw_obj = nullptr;
    if (git_object_lookup(&raw_obj, repo_, &to, GIT_OBJECT_COMMIT) != 0) {
        return Status::err(git_failure("cannot find fast-forward target"));
    }
    ObjectPtr commit(raw_obj, &git_object_free);

    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(repo_, commit.get(), &opts) != 0) {
        return Status::err(git_failure("cannot check out fast-forward target"));
    }

    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, repo_, target.c_str(), GIT_BRANCH_LOCAL) != 0) {
        return Status::err(git_failure("branch '" + target + "' not found"));
    }
    ReferencePtr ref(raw_ref, &git_reference_free);

    git_reference* raw_moved = nullptr;
    if (git_reference_set_target(&raw_moved, ref.get(), &to, "git-mend: fast-forward") != 0) {
        return Status::err(git_failure("cannot fast-forward '" + target + "'"));
    }
    ReferencePtr moved(raw_moved, &git_reference_free);

    qCInfo(mendGitLog) << "fast-forwarded" << QString::fromStdString(target)
                       << "to" << QString::fromStdString(oid_hex(to));
    return Status::ok();
}

Status GitRepository::create_merge_commit(const std::string& target, const std::string& source,
                                          const git_oid& source_oid) {
    auto index = open_index(repo_);
    if (index.is_err()) return Status::err(index.unwrap_err());

    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, index.unwrap().get()) != 0) {
        return Status::err(git_failure("cannot write merged tree"));
    }
    git_tree* raw_tree = nullptr;
    if (git_tree_lookup(&raw_tree, repo_, &tree_oid) != 0) {
        return Status::err(git_failure("cannot load merged tree"));
    }
    TreePtr tree(raw_tree, &git_tree_free);

    auto ours = head_commit(repo_);
    if (ours.is_err()) return Status::err(ours.unwrap_err());

    git_commit* raw_theirs = nullptr;
    if (git_commit_lookup(&raw_theirs, repo_, &source_oid) != 0) {
        return Status::err(git_failure("cannot load '" + source + "' commit"));
    }
    CommitPtr theirs(raw_theirs, &git_commit_free);

    git_signature* raw_sig = nullptr;
    if (git_signature_default(&raw_sig, repo_) != 0) {
        return Status::err(git_failure("cannot create a signature (configure user.name and user.email)"));
    }
    SignaturePtr signature(raw_sig, &git_signature_free);

    const auto message = "Merge branch '" + source + "' into '" + target + "'";
    git_oid commit_oid;
    if (git_commit_create_v(&commit_oid, repo_, "HEAD", signature.get(), signature.get(), nullptr,
                            message.c_str(), tree.get(), 2,
                            static_cast<const git_commit*>(ours.unwrap().get()),
                            static_cast<const git_commit*>(theirs.get())) != 0) {
        return Status::err(git_failure("cannot create merge commit"));
    }
    if (git_repository_state_cleanup(repo_) != 0) {
        return Status::err(git_failure("cannot clean up merge state"));
    }
    qCInfo(mendGitLog) << "created merge commit" << QString::fromStdString(oid_hex(commit_oid));
    return Status::ok();
}

Result<std::string, Error> GitRepository::read_file(const std::string& path) {
    using Out = Result<std::string, Error>;

    const auto full = QDir(QString::fromStdString(workdir())).filePath(QString::fromStdString(path));
    QFile file(full);
    if (!file.open(QIODevice::ReadOnly)) {
        return Out::err(Error{"cannot read '" + path + "': " + file.errorString().toStdString(),
                              ErrorKind::Repository});
    }
    return Out::ok(file.readAll().toStdString());
}

Status GitRepository::write_resolved(const std::string& path, const std::string& content) {
    const auto full = QDir(QString::fromStdString(workdir())).filePath(QString::fromStdString(path));

    QSaveFile file(full);
    if (!file.open(QIODevice::WriteOnly)) {
        return Status::err(Error{"cannot write '" + path + "': " + file.errorString().toStdString(),
                                 ErrorKind::Repository});
    }
    const auto bytes = QByteArray::fromStdString(content);
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        return Status::err(Error{"cannot write '" + path + "': " + file.errorString().toStdString(),
                                 ErrorKind::Repository});
    }

    auto index = open_index(repo_);
    if (index.is_err()) return Status::err(index.unwrap_err());

    // Adding the path also clears its conflict entries.
    if (git_index_add_bypath(index.unwrap().get(), path.c_str()) != 0) {
        return Status::err(git_failure("cannot stage '" + path + "'"));
    }
    if (git_index_write(index.unwrap().get()) != 0) {
        return Status::err(git_failure("cannot write index"));
    }
    qCDebug(mendGitLog) << "staged" << QString::fromStdString(path);
    return Status::ok();
}

Status GitRepository::abort_merge() {
    auto head = head_commit(repo_);
    if (head.is_err()) return Status::err(head.unwrap_err());

    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_FORCE;
    if (git_reset(repo_, reinterpret_cast<git_object*>(head.unwrap().get()), GIT_RESET_HARD, &opts) != 0) {
        return Status::err(git_failure("cannot reset to HEAD"));
    }
    if (git_repository_state_cleanup(repo_) != 0) {
        return Status::err(git_failure("cannot clean up merge state"));
    }
    qCInfo(mendGitLog) << "merge aborted, working tree restored";
    return Status::ok();
}

Status GitRepository::finalize_stage() {
    auto index = open_index(repo_);
    if (index.is_err()) return Status::err(index.unwrap_err());

    if (git_index_has_conflicts(index.unwrap().get())) {
        return Status::err(Error{"index still has conflicts", ErrorKind::Repository});
    }
    if (git_index_write(index.unwrap().get()) != 0) {
        return Status::err(git_failure("cannot write index"));
    }
    qCInfo(mendGitLog) << "resolutions staged; merge left in progress for review";
    return Status::ok();
}

Result<std::vector<CommitSummary>, Error> GitRepository::list_unique_commits(const std::string& target,
                                                                             const std::string& source) {
    using Out = Result<std::vector<CommitSummary>, Error>;

    auto target_oid = branch_commit(target);
    if (target_oid.is_err()) return Out::err(target_oid.unwrap_err());
    auto source_oid = branch_commit(source);
    if (source_oid.is_err()) return Out::err(source_oid.unwrap_err());

    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, repo_) != 0) {
        return Out::err(git_failure("cannot create revision walker"));
    }
    RevwalkPtr walk(raw_walk, &git_revwalk_free);

    if (git_revwalk_sorting(walk.get(), GIT_SORT_TIME) != 0 ||
        git_revwalk_push(walk.get(), &target_oid.unwrap()) != 0 ||
        git_revwalk_hide(walk.get(), &source_oid.unwrap()) != 0) {
        return Out::err(git_failure("cannot set up revision walk"));
    }

    std::vector<CommitSummary> commits;
    git_oid oid;
    int rc = 0;
    while ((rc = git_revwalk_next(&oid, walk.get())) == 0) {
        git_commit* raw_commit = nullptr;
        if (git_commit_lookup(&raw_commit, repo_, &oid) != 0) {
            return Out::err(git_failure("cannot load commit " + oid_hex(oid)));
        }
        CommitPtr commit(raw_commit, &git_commit_free);
        const char* summary = git_commit_summary(commit.get());
        commits.push_back(CommitSummary{oid_hex(oid), summary ? summary : "[invalid commit message]"});
    }
    if (rc != GIT_ITEROVER) {
        return Out::err(git_failure("revision walk failed"));
    }
    return Out::ok(std::move(commits));
}

} // namespace mend::git
