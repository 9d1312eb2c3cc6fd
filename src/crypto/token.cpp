#include "crypto/token.hpp"

#include "core/logging.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include <sodium.h>

#include <array>

namespace qrhost::crypto {
namespace {

const QByteArray::Base64Options kBase64Url =
    QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals;

Error unauthorized(const char* why) {
    return Error{why, ErrorKind::Unauthorized};
}

std::array<unsigned char, crypto_generichash_BYTES> digest(const QByteArray& data) {
    std::array<unsigned char, crypto_generichash_BYTES> out{};
    crypto_generichash(out.data(), out.size(),
                       reinterpret_cast<const unsigned char*>(data.constData()),
                       static_cast<unsigned long long>(data.size()),
                       nullptr, 0);
    return out;
}

bool same_secret(const QString& a, const QString& b) {
    const auto da = digest(a.toUtf8());
    const auto db = digest(b.toUtf8());
    return sodium_memcmp(da.data(), db.data(), da.size()) == 0;
}

QByteArray encode_segment(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toBase64(kBase64Url);
}

Result<QJsonObject, Error> decode_segment(const QByteArray& segment) {
    const auto raw = QByteArray::fromBase64Encoding(
        segment, QByteArray::Base64UrlEncoding | QByteArray::AbortOnBase64DecodingErrors);
    if (!raw) {
        return Result<QJsonObject, Error>::err(unauthorized("token segment is not base64url"));
    }
    const auto doc = QJsonDocument::fromJson(*raw);
    if (doc.isNull() || !doc.isObject()) {
        return Result<QJsonObject, Error>::err(unauthorized("token segment is not a json object"));
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

} // namespace

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium", ErrorKind::Internal});
    }
    return Result<void, Error>::ok();
}

bool check_credentials(const Settings& settings,
                       const QString& username,
                       const QString& password) {
    // Evaluate both comparisons so timing does not reveal which one failed.
    const bool user_ok = same_secret(username, settings.admin_user);
    const bool password_ok = same_secret(password, settings.admin_password);
    return user_ok && password_ok;
}

QByteArray hmac_sha256(const QByteArray& key, const QByteArray& message) {
    crypto_auth_hmacsha256_state state;
    QByteArray mac(crypto_auth_hmacsha256_BYTES, Qt::Uninitialized);

    crypto_auth_hmacsha256_init(&state,
                                reinterpret_cast<const unsigned char*>(key.constData()),
                                static_cast<size_t>(key.size()));
    crypto_auth_hmacsha256_update(&state,
                                  reinterpret_cast<const unsigned char*>(message.constData()),
                                  static_cast<unsigned long long>(message.size()));
    crypto_auth_hmacsha256_final(&state, reinterpret_cast<unsigned char*>(mac.data()));
    sodium_memzero(&state, sizeof(state));
    return mac;
}

QString issue_token(const Settings& settings,
                    const QString& subject,
                    const QDateTime& now) {
    QJsonObject header;
    header["alg"] = QStringLiteral("HS256");
    header["typ"] = QStringLiteral("JWT");

    QJsonObject payload;
    payload["sub"] = subject;
    payload["exp"] = now.toSecsSinceEpoch() +
                     static_cast<qint64>(settings.access_token_expire_minutes) * 60;

    const auto signing_input = encode_segment(header) + '.' + encode_segment(payload);
    const auto signature = hmac_sha256(settings.secret_key.toUtf8(), signing_input);

    return QString::fromLatin1(signing_input + '.' + signature.toBase64(kBase64Url));
}

Result<QString, Error> verify_token(const Settings& settings,
                                   const QString& token,
                                   const QDateTime& now) {
    const auto parts = token.toLatin1().split('.');
    if (parts.size() != 3 || parts[0].isEmpty() || parts[1].isEmpty() || parts[2].isEmpty()) {
        return Result<QString, Error>::err(unauthorized("malformed token"));
    }

    const auto signature = QByteArray::fromBase64Encoding(
        parts[2], QByteArray::Base64UrlEncoding | QByteArray::AbortOnBase64DecodingErrors);
    if (!signature || signature->size() != static_cast<qsizetype>(crypto_auth_hmacsha256_BYTES)) {
        return Result<QString, Error>::err(unauthorized("malformed token signature"));
    }

    const auto expected = hmac_sha256(settings.secret_key.toUtf8(), parts[0] + '.' + parts[1]);
    if (crypto_verify_32(reinterpret_cast<const unsigned char*>(expected.constData()),
                         reinterpret_cast<const unsigned char*>(signature->constData())) != 0) {
        qCInfo(qrhostAuthLog) << "rejected token with bad signature";
        return Result<QString, Error>::err(unauthorized("bad token signature"));
    }

    auto header = decode_segment(parts[0]);
    if (header.is_err()) {
        return Result<QString, Error>::err(header.unwrap_err());
    }
    if (header.unwrap().value("alg").toString() != QStringLiteral("HS256")) {
        return Result<QString, Error>::err(unauthorized("unexpected token algorithm"));
    }

    auto payload = decode_segment(parts[1]);
    if (payload.is_err()) {
        return Result<QString, Error>::err(payload.unwrap_err());
    }
    const auto& claims = payload.unwrap();

    const auto exp = claims.value("exp");
    if (!exp.isDouble()) {
        return Result<QString, Error>::err(unauthorized("token has no expiry"));
    }
    if (static_cast<qint64>(exp.toDouble()) <= now.toSecsSinceEpoch()) {
        return Result<QString, Error>::err(unauthorized("token expired"));
    }

    const auto subject = claims.value("sub").toString();
    if (subject.isEmpty()) {
        return Result<QString, Error>::err(unauthorized("token has no subject"));
    }
    return Result<QString, Error>::ok(subject);
}

Result<QString, Error> bearer_token(const QByteArray& authorization) {
    const auto value = authorization.trimmed();
    const int space = value.indexOf(' ');
    if (space <= 0) {
        return Result<QString, Error>::err(unauthorized("Not authenticated"));
    }
    if (value.left(space).toLower() != "bearer") {
        return Result<QString, Error>::err(unauthorized("Not authenticated"));
    }
    const auto token = value.mid(space + 1).trimmed();
    if (token.isEmpty()) {
        return Result<QString, Error>::err(unauthorized("Not authenticated"));
    }
    return Result<QString, Error>::ok(QString::fromLatin1(token));
}

} // namespace qrhost::crypto
