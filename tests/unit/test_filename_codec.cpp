#include <catch2/catch_test_macros.hpp>

#include "core/filename_codec.hpp"

using namespace qrhost;

TEST_CASE("Filename codec: url-safe base64 without padding", "[codec]") {
    // "https://example.com" is 19 bytes, which would need one '=' of padding.
    REQUIRE(encode_url_to_filename(QStringLiteral("https://example.com")) ==
            QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbQ"));

    // '?' and '>' produce '/' and '+' in standard base64.
    const auto encoded = encode_url_to_filename(QStringLiteral("https://a.io/??>>"));
    REQUIRE_FALSE(encoded.contains(QLatin1Char('/')));
    REQUIRE_FALSE(encoded.contains(QLatin1Char('+')));
    REQUIRE_FALSE(encoded.contains(QLatin1Char('=')));
}

TEST_CASE("Filename codec: decoding restores the url", "[codec]") {
    const QString urls[] = {
        QStringLiteral("https://example.com"),
        QStringLiteral("http://example.com/a?b=c&d=e"),
        QStringLiteral("https://例え.jp/パス"),
    };
    for (const auto& url : urls) {
        const auto decoded = decode_filename_to_url(encode_url_to_filename(url));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == url);
    }
}

TEST_CASE("Filename codec: rejects invalid stems", "[codec]") {
    REQUIRE(decode_filename_to_url(QString{}).is_err());
    REQUIRE(decode_filename_to_url(QStringLiteral("abcde")).is_err());
    REQUIRE(decode_filename_to_url(QStringLiteral("ab*d")).unwrap_err().kind == ErrorKind::Invalid);
}

TEST_CASE("Filename codec: only canonical encodings decode", "[codec]") {
    REQUIRE(decode_filename_to_url(QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbQ")).unwrap() ==
            QStringLiteral("https://example.com"));
    // Differs from the stem above only in the unused trailing bits.
    REQUIRE(decode_filename_to_url(QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbR")).unwrap_err().kind ==
            ErrorKind::Invalid);
    // 0xff is not UTF-8.
    REQUIRE(decode_filename_to_url(QStringLiteral("_w")).is_err());
    // Padding is never part of a stored name.
    REQUIRE(decode_filename_to_url(QStringLiteral("YQ==")).is_err());
}

TEST_CASE("Filename codec: safe file names", "[codec]") {
    REQUIRE(is_safe_filename(QStringLiteral("aHR0cHM6Ly9leGFtcGxlLmNvbQ.png")));
    REQUIRE_FALSE(is_safe_filename(QString{}));
    REQUIRE_FALSE(is_safe_filename(QStringLiteral("../secret.png")));
    REQUIRE_FALSE(is_safe_filename(QStringLiteral("a/b.png")));
    REQUIRE_FALSE(is_safe_filename(QStringLiteral("a\\b.png")));
    REQUIRE_FALSE(is_safe_filename(QStringLiteral(".hidden.png")));
}
