#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>

#include <cstdio>

Q_LOGGING_CATEGORY(qrhostHttpLog, "qrhost.http", QtInfoMsg)
Q_LOGGING_CATEGORY(qrhostStoreLog, "qrhost.store", QtInfoMsg)
Q_LOGGING_CATEGORY(qrhostRenderLog, "qrhost.render", QtInfoMsg)
Q_LOGGING_CATEGORY(qrhostAuthLog, "qrhost.auth", QtInfoMsg)
Q_LOGGING_CATEGORY(qrhostConfigLog, "qrhost.config", QtInfoMsg)

namespace qrhost {
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

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "qrhost: cannot create log directory %s\n",
                     qPrintable(dir.absolutePath()));
        return;
    }

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "qrhost: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto line = format_log_line(type, ctx.category, msg).toUtf8() + '\n';

    auto& s = state();
    QMutexLocker lock(&s.mu);

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

QString format_log_line(QtMsgType type, const char* category, const QString& msg) {
    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = category ? QString::fromLatin1(category) : QString{};
    return QStringLiteral("%1 %2 %3 %4")
        .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
}

void install_logging(const QString& log_file) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        open_log_file(s, log_file);
    }
    qInstallMessageHandler(message_handler);
}

QString current_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

} // namespace qrhost
