#include "logging/logging.hpp"

#include <QDateTime>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

namespace mend {

Q_LOGGING_CATEGORY(mendMergeLog, "mend.merge")
Q_LOGGING_CATEGORY(mendAiLog, "mend.ai")
Q_LOGGING_CATEGORY(mendGitLog, "mend.git")
Q_LOGGING_CATEGORY(mendConfigLog, "mend.config")
Q_LOGGING_CATEGORY(mendNetworkLog, "mend.network")

namespace logging {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

QMutex& output_mutex() {
    static QMutex mu;
    return mu;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto line = format_log_line(type, ctx.category, msg).toUtf8();

    QMutexLocker lock(&output_mutex());
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);
}

} // namespace

QString format_log_line(QtMsgType type, const char* category, const QString& msg) {
    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = category ? QString::fromLatin1(category) : QString{};
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
}

bool debug_requested_by_env() {
    const auto value = qEnvironmentVariable("MEND_DEBUG");
    return !value.isEmpty() && value != QStringLiteral("0");
}

void install_stderr_logging(bool verbose) {
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("mend.*=true\n"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("mend.*.debug=false\n"
                                                        "mend.*.info=false\n"));
    }
    qInstallMessageHandler(message_handler);
}

} // namespace logging
} // namespace mend
