#include <catch2/catch_test_macros.hpp>

#include "core/logging.hpp"

#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

using namespace qrhost;

TEST_CASE("Logging: line carries timestamp, level and category", "[logging]") {
    const auto line = format_log_line(QtWarningMsg, "qrhost.store", QStringLiteral("disk full"));
    const QRegularExpression pattern(
        QStringLiteral(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z W qrhost\.store disk full$)"));
    REQUIRE(pattern.match(line).hasMatch());
}

TEST_CASE("Logging: file sink receives categorized messages", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/qrhost.log"));

    install_logging(path);
    REQUIRE(current_log_file_path() == path);
    qCInfo(qrhostStoreLog) << "stored" << 42;
    install_logging();
    qInstallMessageHandler(nullptr);

    QFile f(path);
    REQUIRE(f.open(QIODevice::ReadOnly));
    const auto contents = QString::fromUtf8(f.readAll());
    REQUIRE(contents.contains(QStringLiteral(" I qrhost.store stored 42")));
}
