#include "merge/merge_orchestrator.hpp"

#include "ai/prompt.hpp"
#include "core/conflict_extractor.hpp"
#include "core/resolution_attempt.hpp"
#include "logging/logging.hpp"

#include <QString>

#include <algorithm>
#include <vector>

namespace mend {
namespace {

QString qs(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

RegionReport report_for(const ResolutionAttempt& attempt) {
    RegionReport r;
    r.start_line = attempt.region.start_line;
    r.end_line = attempt.region.end_line;
    r.attempts = attempt.attempt_count;
    r.succeeded = attempt.succeeded();
    r.low_confidence = attempt.succeeded() && attempt.low_confidence;
    if (attempt.failure) {
        r.reason = attempt.failure->message;
    }
    return r;
}

} // namespace

MergeOrchestrator::MergeOrchestrator(MergeRepository& repo, ai::ResolutionClient& client, const Settings& settings)
    : repo_(repo), client_(client), settings_(settings), applier_(repo) {
}

bool MergeOrchestrator::check_branch(MergeSession& session, const std::string& name) {
    auto exists = repo_.branch_exists(name);
    if (exists.is_err()) {
        session.fatal_error = exists.unwrap_err();
        return false;
    }
    if (!exists.unwrap()) {
        session.fatal_error = Error{"branch '" + name + "' does not exist", ErrorKind::Repository};
        return false;
    }
    return true;
}

void MergeOrchestrator::abort(MergeSession& session) {
    auto aborted = repo_.abort_merge();
    if (aborted.is_err()) {
        qCCritical(mendMergeLog) << "abort failed:" << qs(aborted.unwrap_err().message);
        if (!session.fatal_error) {
            session.fatal_error = aborted.unwrap_err();
        }
        return;
    }
    session.transition(MergeState::Aborted);
}

MergeSession MergeOrchestrator::run(const std::string& target, const std::string& source) {
    MergeSession session;
    session.target_branch = target;
    session.source_branch = source;

    if (!check_branch(session, target) || !check_branch(session, source)) {
        qCCritical(mendMergeLog) << qs(session.fatal_error->message);
        return session;
    }

    auto merged = repo_.attempt_merge(target, source);
    if (merged.is_err()) {
        session.fatal_error = merged.unwrap_err();
        qCCritical(mendMergeLog) << "merge failed:" << qs(session.fatal_error->message);
        return session;
    }
    session.transition(MergeState::MergeAttempted);

    const auto& outcome = merged.unwrap();
    session.merge_kind = outcome.kind;
    if (!outcome.has_conflicts()) {
        qCInfo(mendMergeLog) << "merge completed without conflicts";
        session.transition(MergeState::Committed);
        return session;
    }

    session.conflicted_files = outcome.conflicted_files;
    session.transition(MergeState::ConflictsDetected);
    qCInfo(mendMergeLog) << "conflicts in" << session.conflicted_files.size() << "file(s)";

    if (!settings_.has_api_key()) {
        session.fatal_error = Error{"no API key configured: set MEND_API_KEY or OPENAI_API_KEY, "
                                    "or resolve the conflicts manually",
                                    ErrorKind::Credentials};
        qCWarning(mendMergeLog) << qs(session.fatal_error->message);
        abort(session);
        return session;
    }

    session.transition(MergeState::ResolvingConflicts);
    for (const auto& path : session.conflicted_files) {
        if (!resolve_file(session, outcome, path)) {
            qCCritical(mendMergeLog) << "stopping:" << qs(session.fatal_error->message);
            abort(session);
            return session;
        }
    }

    if (session.all_files_succeeded()) {
        session.transition(MergeState::AllResolved);
        auto finalized = repo_.finalize_stage();
        if (finalized.is_err()) {
            session.fatal_error = finalized.unwrap_err();
            qCCritical(mendMergeLog) << "finalize failed:" << qs(session.fatal_error->message);
            abort(session);
            return session;
        }
        session.transition(MergeState::Committed);
        qCInfo(mendMergeLog) << "all conflicts resolved and staged";
        return session;
    }

    session.transition(session.any_region_succeeded() ? MergeState::PartiallyResolved
                                                      : MergeState::ResolutionFailed);
    qCWarning(mendMergeLog) << "not every conflict could be resolved, aborting merge";
    abort(session);
    return session;
}

bool MergeOrchestrator::resolve_file(MergeSession& session, const MergeOutcome& outcome, const std::string& path) {
    FileReport file;
    file.path = path;

    if (outcome.is_non_textual(path)) {
        file.error = Error{"conflict has no textual markers (binary or deleted on one side)", ErrorKind::Extraction};
        qCWarning(mendMergeLog) << qs(path) << ":" << qs(file.error->message);
        session.files.push_back(std::move(file));
        return true;
    }

    auto content = repo_.read_file(path);
    if (content.is_err()) {
        session.fatal_error = content.unwrap_err();
        return false;
    }
    const auto& text = content.unwrap();

    auto regions = extract_conflicts(path, text);
    if (regions.is_err()) {
        file.error = regions.unwrap_err();
        qCWarning(mendMergeLog) << qs(file.error->message);
        session.files.push_back(std::move(file));
        return true;
    }

    if (regions.unwrap().empty()) {
        qCInfo(mendMergeLog) << qs(path) << "has no markers left, staging as is";
        auto staged = applier_.stage_clean_file(path, text);
        if (staged.is_err()) {
            session.fatal_error = staged.unwrap_err();
            return false;
        }
        file.outcome = FileOutcome::AllSucceeded;
        session.files.push_back(std::move(file));
        return true;
    }

    const auto context_lines = static_cast<size_t>(std::max(0, settings_.context_lines));
    std::vector<ResolutionAttempt> attempts;
    attempts.reserve(regions.unwrap().size());
    for (auto& region : regions.unwrap()) {
        attempts.emplace_back(std::move(region));
    }

    qCInfo(mendMergeLog) << "resolving" << attempts.size() << "region(s) in" << qs(path);
    for (auto& attempt : attempts) {
        client_.resolve(attempt, ai::context_for(text, attempt.region, context_lines));
        if (attempt.failed() && attempt.failure->kind == ErrorKind::Credentials) {
            // No later call can succeed; report this instead of per-region failures.
            session.fatal_error = *attempt.failure;
            return false;
        }
    }

    auto applied = applier_.apply_file(path, text, attempts);
    if (applied.is_err()) {
        session.fatal_error = applied.unwrap_err();
        return false;
    }

    for (const auto& attempt : attempts) {
        file.regions.push_back(report_for(attempt));
    }
    const auto succeeded = file.succeeded_regions();
    if (applied.unwrap()) {
        file.outcome = FileOutcome::AllSucceeded;
    } else if (succeeded > 0) {
        file.outcome = FileOutcome::Partial;
    } else {
        file.outcome = FileOutcome::Failed;
    }
    qCInfo(mendMergeLog) << qs(path) << ":" << succeeded << "of" << attempts.size() << "region(s) resolved";

    session.files.push_back(std::move(file));
    return true;
}

} // namespace mend
