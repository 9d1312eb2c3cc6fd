#include <catch2/catch_test_macros.hpp>

#include "crypto/token.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimeZone>

using namespace qrhost;

namespace {

Settings test_settings() {
    Settings s;
    s.secret_key = QStringLiteral("unit-test-secret");
    s.access_token_expire_minutes = 30;
    s.admin_user = QStringLiteral("admin");
    s.admin_password = QStringLiteral("secret");
    return s;
}

QDateTime at(qint64 secs) {
    return QDateTime::fromSecsSinceEpoch(secs, QTimeZone::UTC);
}

QByteArray segment(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact)
        .toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
}

// A token with the given header, correctly signed with the settings key.
QString signed_token(const Settings& settings, const QJsonObject& header, const QJsonObject& payload) {
    const auto input = segment(header) + '.' + segment(payload);
    const auto sig = crypto::hmac_sha256(settings.secret_key.toUtf8(), input)
        .toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
    return QString::fromLatin1(input + '.' + sig);
}

} // namespace

TEST_CASE("Token: libsodium initializes", "[auth]") {
    REQUIRE(crypto::init().is_ok());
}

TEST_CASE("Token: HMAC-SHA256 matches RFC 4231 test case 2", "[auth]") {
    REQUIRE(crypto::init().is_ok());
    const auto mac = crypto::hmac_sha256(QByteArrayLiteral("Jefe"),
                                         QByteArrayLiteral("what do ya want for nothing?"));
    REQUIRE(mac.toHex() ==
            QByteArrayLiteral("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
}

TEST_CASE("Token: issued token verifies until it expires", "[auth]") {
    REQUIRE(crypto::init().is_ok());
    const auto settings = test_settings();
    const auto issued_at = at(1'700'000'000);

    const auto token = crypto::issue_token(settings, QStringLiteral("admin"), issued_at);
    REQUIRE(token.count(QLatin1Char('.')) == 2);

    const auto fresh = crypto::verify_token(settings, token, issued_at.addSecs(60));
    REQUIRE(fresh.is_ok());
    REQUIRE(fresh.unwrap() == QStringLiteral("admin"));

    const auto expired = crypto::verify_token(settings, token, issued_at.addSecs(30 * 60));
    REQUIRE(expired.is_err());
    REQUIRE(expired.unwrap_err().kind == ErrorKind::Unauthorized);
}

TEST_CASE("Token: tampering and foreign keys are rejected", "[auth]") {
    REQUIRE(crypto::init().is_ok());
    const auto settings = test_settings();
    const auto now = at(1'700'000'000);
    const auto token = crypto::issue_token(settings, QStringLiteral("admin"), now);

    auto other = settings;
    other.secret_key = QStringLiteral("another-secret");
    REQUIRE(crypto::verify_token(other, token, now).is_err());

    auto tampered = token;
    const auto sig = tampered.lastIndexOf(QLatin1Char('.')) + 1;
    tampered[sig] = tampered[sig] == QLatin1Char('A') ? QLatin1Char('B') : QLatin1Char('A');
    REQUIRE(crypto::verify_token(settings, tampered, now).is_err());

    REQUIRE(crypto::verify_token(settings, QStringLiteral("not-a-token"), now).is_err());
    REQUIRE(crypto::verify_token(settings, QStringLiteral("a.b.c"), now).is_err());
}

TEST_CASE("Token: only HS256 headers are accepted", "[auth]") {
    REQUIRE(crypto::init().is_ok());
    const auto settings = test_settings();
    const auto now = at(1'700'000'000);

    QJsonObject payload;
    payload["sub"] = QStringLiteral("admin");
    payload["exp"] = now.toSecsSinceEpoch() + 600;

    QJsonObject hs256;
    hs256["alg"] = QStringLiteral("HS256");
    hs256["typ"] = QStringLiteral("JWT");
    REQUIRE(crypto::verify_token(settings, signed_token(settings, hs256, payload), now).unwrap() ==
            QStringLiteral("admin"));

    QJsonObject none;
    none["alg"] = QStringLiteral("none");
    none["typ"] = QStringLiteral("JWT");
    const auto rejected = crypto::verify_token(settings, signed_token(settings, none, payload), now);
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.unwrap_err().kind == ErrorKind::Unauthorized);
    REQUIRE(rejected.unwrap_err().message == "unexpected token algorithm");
}

TEST_CASE("Token: credentials check", "[auth]") {
    REQUIRE(crypto::init().is_ok());
    const auto settings = test_settings();

    REQUIRE(crypto::check_credentials(settings, QStringLiteral("admin"), QStringLiteral("secret")));
    REQUIRE_FALSE(crypto::check_credentials(settings, QStringLiteral("admin"), QStringLiteral("Secret")));
    REQUIRE_FALSE(crypto::check_credentials(settings, QStringLiteral("root"), QStringLiteral("secret")));
    REQUIRE_FALSE(crypto::check_credentials(settings, QString{}, QString{}));
}

TEST_CASE("Token: bearer header parsing", "[auth]") {
    REQUIRE(crypto::bearer_token("Bearer abc.def.ghi").unwrap() == QStringLiteral("abc.def.ghi"));
    REQUIRE(crypto::bearer_token("bearer   xyz ").unwrap() == QStringLiteral("xyz"));
    REQUIRE(crypto::bearer_token(QByteArray{}).is_err());
    REQUIRE(crypto::bearer_token("Basic dXNlcjpwYXNz").is_err());
    REQUIRE(crypto::bearer_token("Bearer").unwrap_err().kind == ErrorKind::Unauthorized);
}
