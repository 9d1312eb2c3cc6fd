#include <catch2/catch_test_macros.hpp>

#include "core/filename_codec.hpp"
#include "service/qr_code_service.hpp"

#include <QFile>
#include <QImage>
#include <QTemporaryDir>

using namespace qrhost;
using namespace qrhost::service;

namespace {

QrCodeService make_service(const QTemporaryDir& dir) {
    Settings settings;
    settings.qr_directory = dir.path();
    storage::QrStore store(settings.qr_directory);
    REQUIRE(store.ensure_directory().is_ok());
    return QrCodeService(settings, store);
}

} // namespace

TEST_CASE("QrCodeService: target url validation", "[service]") {
    REQUIRE(is_valid_target_url(QStringLiteral("https://example.com")));
    REQUIRE(is_valid_target_url(QStringLiteral("http://localhost:8000/a?b=c")));
    REQUIRE_FALSE(is_valid_target_url(QStringLiteral("example.com")));
    REQUIRE_FALSE(is_valid_target_url(QStringLiteral("ftp://example.com/file")));
    REQUIRE_FALSE(is_valid_target_url(QStringLiteral("https://")));
    REQUIRE_FALSE(is_valid_target_url(QString{}));
}

TEST_CASE("QrCodeService: describe computes file name and download url", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto service = make_service(dir);

    const auto entry = service.describe(QStringLiteral("https://example.com"));
    REQUIRE(entry.is_ok());
    REQUIRE(entry.unwrap().filename == QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbQ.png"));
    REQUIRE(entry.unwrap().download_url ==
            QStringLiteral("http://localhost:80/downloads/aHR0cHM6Ly9leGFtcGxlLmNvbQ.png"));

    const QString long_url = QStringLiteral("https://example.com/") + QString(300, QLatin1Char('x'));
    REQUIRE(service.describe(long_url).unwrap_err().message == "URL too long");
}

TEST_CASE("QrCodeService: create stores a png once", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    auto service = make_service(dir);

    const auto created = service.create({QStringLiteral("https://example.com"), 5});
    REQUIRE(created.is_ok());

    const auto path = service.store().path_for(created.unwrap().filename);
    REQUIRE(QFile::exists(path));
    const QImage image(path);
    REQUIRE_FALSE(image.isNull());
    REQUIRE(image.width() % 5 == 0);
    REQUIRE(image.pixel(0, 0) == QColor(Qt::white).rgb());

    const auto again = service.create({QStringLiteral("https://example.com"), 5});
    REQUIRE(again.is_err());
    REQUIRE(again.unwrap_err().kind == ErrorKind::Conflict);
}

TEST_CASE("QrCodeService: create validates size and url", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    auto service = make_service(dir);

    REQUIRE(service.create({QStringLiteral("https://example.com"), 0}).unwrap_err().kind == ErrorKind::Invalid);
    REQUIRE(service.create({QStringLiteral("https://example.com"), 41}).unwrap_err().kind == ErrorKind::Invalid);
    REQUIRE(service.create({QStringLiteral("not a url"), 10}).unwrap_err().kind == ErrorKind::Invalid);
    REQUIRE(service.list().unwrap().empty());
}

TEST_CASE("QrCodeService: list decodes urls and skips foreign files", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    auto service = make_service(dir);

    REQUIRE(service.create({QStringLiteral("https://b.example.com"), 2}).is_ok());
    REQUIRE(service.create({QStringLiteral("https://a.example.com"), 2}).is_ok());
    REQUIRE(service.store().write(QStringLiteral("not*base64.png"), QByteArrayLiteral("x")).is_ok());
    // Decodes to a lone 0xff byte, which is not UTF-8.
    REQUIRE(service.store().write(QStringLiteral("_w.png"), QByteArrayLiteral("x")).is_ok());
    // Same bytes as https://example.com, but with non-zero padding bits.
    REQUIRE(service.store().write(QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbR.png"), QByteArrayLiteral("x")).is_ok());

    const auto entries = service.list();
    REQUIRE(entries.is_ok());
    REQUIRE(entries.unwrap().size() == 2);

    QStringList urls;
    for (const auto& entry : entries.unwrap()) {
        urls.append(entry.target_url);
        REQUIRE(entry.download_url.endsWith(entry.filename));
    }
    urls.sort();
    REQUIRE(urls == QStringList{QStringLiteral("https://a.example.com"), QStringLiteral("https://b.example.com")});

    // The foreign spelling does not block creating the canonical file.
    const auto created = service.create({QStringLiteral("https://example.com"), 2});
    REQUIRE(created.is_ok());
    REQUIRE(created.unwrap().filename == QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbQ.png"));
}

TEST_CASE("QrCodeService: read and remove", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    auto service = make_service(dir);

    const auto entry = service.create({QStringLiteral("https://example.com"), 2}).unwrap();
    REQUIRE(service.read(entry.filename).unwrap().startsWith(QByteArrayLiteral("\x89PNG")));
    REQUIRE(service.remove(entry.filename).is_ok());
    REQUIRE(service.read(entry.filename).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(service.remove(entry.filename).unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("QrCodeService: links follow the configured base url", "[service]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto service = make_service(dir);
    const auto entry = service.describe(QStringLiteral("https://example.com")).unwrap();

    const auto links = service.links_for(LinkAction::Create, entry);
    REQUIRE(links.size() == 2);
    REQUIRE(links[1].href == QStringLiteral("http://localhost:80/qr-codes/") + entry.filename);
}
