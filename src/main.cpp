#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "ai/resolution_client.hpp"
#include "cli/report.hpp"
#include "config/settings.hpp"
#include "git/git_repository.hpp"
#include "logging/logging.hpp"
#include "merge/merge_orchestrator.hpp"
#include "network/openai_client.hpp"

#include <exception>

namespace {

constexpr int kExitUsage = 2;

int run_merge(mend::git::GitRepository& repo, const std::string& target, const std::string& source) {
    auto settings = mend::Settings::load();
    if (settings.is_err()) {
        QTextStream(stderr) << QString::fromStdString(settings.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    const auto& config = settings.unwrap();

    mend::network::OpenAiClient service(config);
    mend::ai::ResolutionClient resolver(service, config);
    mend::MergeOrchestrator orchestrator(repo, resolver, config);

    const auto session = orchestrator.run(target, source);
    QTextStream(stdout) << mend::cli::format_merge_report(session);
    return session.exit_code();
}

int run_list_unique(mend::git::GitRepository& repo, const std::string& target, const std::string& source) {
    for (const auto& name : {target, source}) {
        auto exists = repo.branch_exists(name);
        if (exists.is_err()) {
            QTextStream(stderr) << QString::fromStdString(exists.unwrap_err().message) << QLatin1Char('\n');
            return 1;
        }
        if (!exists.unwrap()) {
            QTextStream(stderr) << QStringLiteral("branch '%1' does not exist\n").arg(QString::fromStdString(name));
            return 1;
        }
    }

    auto commits = repo.list_unique_commits(target, source);
    if (commits.is_err()) {
        QTextStream(stderr) << QString::fromStdString(commits.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << mend::cli::format_unique_commits(target, source, commits.unwrap());
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("git-mend");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Merge git branches, resolving conflicts with a language model."));
    const auto helpOption = parser.addHelpOption();
    const auto versionOption = parser.addVersionOption();

    const QCommandLineOption repoOption(
        QStringList{QStringLiteral("repo")},
        QStringLiteral("Path inside the repository (default: current directory)."),
        QStringLiteral("path"),
        QStringLiteral("."));
    parser.addOption(repoOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Log progress to stderr (also enabled by MEND_DEBUG=1)."));
    parser.addOption(verboseOption);

    const QCommandLineOption targetOption(
        QStringList{QStringLiteral("t"), QStringLiteral("target")},
        QStringLiteral("Branch to merge into."),
        QStringLiteral("branch"));
    parser.addOption(targetOption);

    const QCommandLineOption sourceOption(
        QStringList{QStringLiteral("s"), QStringLiteral("source")},
        QStringLiteral("Branch to merge from."),
        QStringLiteral("branch"));
    parser.addOption(sourceOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'merge' or 'list-unique'."));

    if (!parser.parse(app.arguments())) {
        QTextStream(stderr) << parser.errorText() << QLatin1Char('\n');
        return kExitUsage;
    }
    if (parser.isSet(helpOption)) {
        parser.showHelp(0);
    }
    if (parser.isSet(versionOption)) {
        parser.showVersion();
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QString{} : positional.first();
    if (positional.size() != 1 ||
        (command != QStringLiteral("merge") && command != QStringLiteral("list-unique"))) {
        QTextStream(stderr) << QStringLiteral("expected exactly one command: merge or list-unique\n");
        QTextStream(stderr) << parser.helpText();
        return kExitUsage;
    }

    const auto target = parser.value(targetOption).toStdString();
    const auto source = parser.value(sourceOption).toStdString();
    if (target.empty() || source.empty()) {
        QTextStream(stderr) << QStringLiteral("both --target and --source are required\n");
        return kExitUsage;
    }

    mend::logging::install_stderr_logging(parser.isSet(verboseOption) || mend::logging::debug_requested_by_env());

    try {
        auto repo = mend::git::GitRepository::open(parser.value(repoOption).toStdString());
        if (repo.is_err()) {
            QTextStream(stderr) << QString::fromStdString(repo.unwrap_err().message) << QLatin1Char('\n');
            return 1;
        }

        if (command == QStringLiteral("list-unique")) {
            return run_list_unique(*repo.unwrap(), target, source);
        }
        return run_merge(*repo.unwrap(), target, source);
    } catch (const std::exception& e) {
        qCCritical(mend::mendMergeLog) << "unexpected failure:" << e.what();
        return 1;
    }
}
