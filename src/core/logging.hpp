#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(qrhostHttpLog)
Q_DECLARE_LOGGING_CATEGORY(qrhostStoreLog)
Q_DECLARE_LOGGING_CATEGORY(qrhostRenderLog)
Q_DECLARE_LOGGING_CATEGORY(qrhostAuthLog)
Q_DECLARE_LOGGING_CATEGORY(qrhostConfigLog)

namespace qrhost {

// Installs a Qt message handler that stamps every line with time, level and
// category and writes it to stderr. When log_file is non-empty the same lines
// are appended to that file as well.
void install_logging(const QString& log_file = QString{});

// Path currently receiving log lines (empty when logging to stderr only).
QString current_log_file_path();

// Formats one log line without the trailing newline. Exposed for tests.
QString format_log_line(QtMsgType type, const char* category, const QString& msg);

} // namespace qrhost
