#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QTextStream>

#include "cli/commands.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/token.hpp"
#include "network/http_api.hpp"
#include "service/qr_code_service.hpp"
#include "storage/qr_store.hpp"

namespace {

int fail(const qrhost::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("qrhost");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("QR code image service"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dirOption(
        QStringList{QStringLiteral("qr-dir")},
        QStringLiteral("Directory holding QR code images (overrides QR_CODE_DIR)."),
        QStringLiteral("path"));
    parser.addOption(dirOption);

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("Listen address (overrides QRHOST_HOST)."),
        QStringLiteral("address"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Listen port (overrides QRHOST_PORT)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log lines to this file (overrides QRHOST_LOG_FILE)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugHttpOption(
        QStringList{QStringLiteral("debug-http")},
        QStringLiteral("Enable HTTP and auth debug logging."));
    parser.addOption(debugHttpOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for 'list')."));
    parser.addOption(jsonOption);

    const QCommandLineOption sizeOption(
        QStringList{QStringLiteral("size")},
        QStringLiteral("Pixels per module for 'generate' (1-40, default 10)."),
        QStringLiteral("pixels"));
    parser.addOption(sizeOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("serve (default), list, or generate <url>."));
    parser.process(app);

    auto loaded = qrhost::load_settings(qrhost::process_environment());
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    auto settings = std::move(loaded).unwrap();

    if (parser.isSet(dirOption)) {
        settings.qr_directory = parser.value(dirOption);
    }
    if (parser.isSet(hostOption)) {
        settings.listen_host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            return fail(qrhost::Error{"--port: expected a port number", qrhost::ErrorKind::Invalid});
        }
        settings.listen_port = static_cast<uint16_t>(port);
    }
    if (parser.isSet(logFileOption)) {
        settings.log_file = parser.value(logFileOption);
    }
    auto valid = qrhost::validate_settings(settings);
    if (valid.is_err()) {
        return fail(valid.unwrap_err());
    }

    qrhost::install_logging(settings.log_file);
    if (parser.isSet(debugHttpOption)) {
        QLoggingCategory::setFilterRules(
            QStringLiteral("qrhost.http.debug=true\nqrhost.auth.debug=true\n"));
        qCDebug(qrhostHttpLog) << "HTTP debug logging enabled";
    }

    auto crypto_result = qrhost::crypto::init();
    if (crypto_result.is_err()) {
        qCritical() << "Failed to initialize crypto:"
                    << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    qrhost::storage::QrStore store(settings.qr_directory);
    auto dir_result = store.ensure_directory();
    if (dir_result.is_err()) {
        qCritical() << dir_result.unwrap_err().message.c_str();
        return 1;
    }

    qrhost::service::QrCodeService service(settings, store);

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("serve") : positional.first();

    if (command == QStringLiteral("list")) {
        const auto result = qrhost::cli::run_list(service, {.json = parser.isSet(jsonOption)});
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        QTextStream(stdout) << result.unwrap();
        return 0;
    }

    if (command == QStringLiteral("generate")) {
        if (positional.size() < 2) {
            return fail(qrhost::Error{"usage: qrhost generate <url> [--size N]", qrhost::ErrorKind::Invalid});
        }
        qrhost::service::CreateRequest request;
        request.url = positional.at(1);
        if (parser.isSet(sizeOption)) {
            bool ok = false;
            request.size = parser.value(sizeOption).toInt(&ok);
            if (!ok) {
                return fail(qrhost::Error{"--size: expected an integer", qrhost::ErrorKind::Invalid});
            }
        }
        const auto result = qrhost::cli::run_generate(service, request);
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        QTextStream(stdout) << result.unwrap() << QLatin1Char('\n');
        return 0;
    }

    if (command != QStringLiteral("serve")) {
        return fail(qrhost::Error{"unknown command: " + command.toStdString(), qrhost::ErrorKind::Invalid});
    }

    const QHostAddress address(settings.listen_host);
    if (address.isNull()) {
        return fail(qrhost::Error{"invalid listen address: " + settings.listen_host.toStdString(),
                                  qrhost::ErrorKind::Invalid});
    }

    qrhost::network::HttpApi api(service);
    auto listening = api.listen(address, settings.listen_port);
    if (listening.is_err()) {
        qCritical() << "Failed to start HTTP server:" << listening.unwrap_err().message.c_str();
        return 1;
    }
    qInfo() << "qrhost: serving" << settings.qr_directory << "on port" << listening.unwrap();

    return app.exec();
}
