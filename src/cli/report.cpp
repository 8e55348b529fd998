#include "cli/report.hpp"

#include <QStringList>

namespace mend::cli {

namespace {

[[nodiscard]] QString qs(const std::string& text) {
    return QString::fromStdString(text);
}

[[nodiscard]] QString line_range(const RegionReport& region) {
    return QStringLiteral("lines %1-%2").arg(region.start_line + 1).arg(region.end_line + 1);
}

[[nodiscard]] QString render_region(const RegionReport& region) {
    QString line = QStringLiteral("    ") + line_range(region) + QStringLiteral(": ");
    if (region.succeeded) {
        line += QStringLiteral("resolved");
        if (region.low_confidence) {
            line += QStringLiteral(" (low confidence, review before committing)");
        }
        return line;
    }
    line += QStringLiteral("unresolved");
    if (!region.reason.empty()) {
        line += QStringLiteral(" - ") + qs(region.reason);
    }
    return line;
}

[[nodiscard]] QString render_file_header(const FileReport& file) {
    switch (file.outcome) {
        case FileOutcome::AllSucceeded:
            if (file.regions.empty()) {
                return QStringLiteral("[ok] %1 (no markers left)").arg(qs(file.path));
            }
            return QStringLiteral("[ok] %1 (%2 region(s))").arg(qs(file.path)).arg(file.regions.size());
        case FileOutcome::Partial:
            return QStringLiteral("[partial] %1 (%2 of %3 region(s) resolved)")
                .arg(qs(file.path))
                .arg(file.succeeded_regions())
                .arg(file.regions.size());
        case FileOutcome::Failed:
            break;
    }
    if (file.error) {
        return QStringLiteral("[failed] %1: %2").arg(qs(file.path), qs(file.error->message));
    }
    return QStringLiteral("[failed] %1 (no region resolved)").arg(qs(file.path));
}

[[nodiscard]] QString render_merge_kind(MergeOutcome::Kind kind) {
    switch (kind) {
        case MergeOutcome::Kind::UpToDate: return QStringLiteral("Already up to date.");
        case MergeOutcome::Kind::FastForward: return QStringLiteral("Fast-forwarded.");
        case MergeOutcome::Kind::Clean: return QStringLiteral("Merged without conflicts.");
        case MergeOutcome::Kind::Conflicted: break;
    }
    return QString{};
}

} // namespace

QString format_merge_report(const MergeSession& session) {
    QStringList out;
    out.append(QStringLiteral("Merging '%1' into '%2'")
                   .arg(qs(session.source_branch), qs(session.target_branch)));

    if (session.credentials_failed()) {
        out.append(QStringLiteral("Credential failure: ") + qs(session.fatal_error->message));
        out.append(session.state == MergeState::Aborted
                       ? QStringLiteral("Merge aborted; working tree restored. Resolve the conflicts manually.")
                       : QStringLiteral("Merge could not be aborted; check the repository state."));
        return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
    }

    if (session.state == MergeState::Committed && session.conflicted_files.empty()) {
        out.append(render_merge_kind(session.merge_kind));
        return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
    }

    for (const auto& file : session.files) {
        out.append(render_file_header(file));
        for (const auto& region : file.regions) {
            out.append(render_region(region));
        }
    }

    if (session.fatal_error) {
        out.append(QStringLiteral("Error: ") + qs(session.fatal_error->message));
    }

    switch (session.state) {
        case MergeState::Committed:
            out.append(QStringLiteral("All conflicts resolved and staged. Review the changes and commit."));
            break;
        case MergeState::Aborted:
            out.append(QStringLiteral("Merge aborted; working tree restored. Resolve the conflicts manually."));
            break;
        default:
            if (!session.conflicted_files.empty()) {
                out.append(QStringLiteral("Merge left in progress; check the repository state."));
            }
            break;
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_unique_commits(const std::string& target,
                              const std::string& source,
                              const std::vector<git::CommitSummary>& commits) {
    if (commits.empty()) {
        return QStringLiteral("No unique commits found.\n");
    }

    QStringList out;
    out.append(QStringLiteral("Commits in '%1' not in '%2':").arg(qs(target), qs(source)));
    int n = 1;
    for (const auto& commit : commits) {
        out.append(QStringLiteral("%1. %2 - %3")
                       .arg(n++)
                       .arg(qs(commit.id.substr(0, 7)), qs(commit.summary)));
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace mend::cli
