#pragma once

#include <QLoggingCategory>
#include <QString>

namespace mend {

Q_DECLARE_LOGGING_CATEGORY(mendMergeLog)
Q_DECLARE_LOGGING_CATEGORY(mendAiLog)
Q_DECLARE_LOGGING_CATEGORY(mendGitLog)
Q_DECLARE_LOGGING_CATEGORY(mendConfigLog)
Q_DECLARE_LOGGING_CATEGORY(mendNetworkLog)

namespace logging {

// Installs a Qt message handler that writes timestamped, categorized lines to
// stderr, keeping stdout free for the merge report. Without `verbose` only
// warnings and above are shown for the mend.* categories.
void install_stderr_logging(bool verbose);

// True when MEND_DEBUG is set to a non-zero value.
[[nodiscard]] bool debug_requested_by_env();

// Formats one log line; exposed for tests.
[[nodiscard]] QString format_log_line(QtMsgType type, const char* category, const QString& msg);

} // namespace logging
} // namespace mend
