#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QString>

namespace qrhost::crypto {

/**
 * Initialize libsodium. Must succeed before any other function here is used.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Constant-time check of a login against ADMIN_USER / ADMIN_PASSWORD.
 */
[[nodiscard]] bool check_credentials(const Settings& settings,
                                     const QString& username,
                                     const QString& password);

/**
 * HMAC-SHA256 of message keyed by key (any key length).
 */
[[nodiscard]] QByteArray hmac_sha256(const QByteArray& key, const QByteArray& message);

/**
 * Issue a compact HS256 JWT for subject, expiring after the configured
 * number of minutes counted from now.
 */
[[nodiscard]] QString issue_token(const Settings& settings,
                                  const QString& subject,
                                  const QDateTime& now);

/**
 * Verify signature, algorithm and expiry of a token and return its subject.
 * Every failure is reported as ErrorKind::Unauthorized.
 */
[[nodiscard]] Result<QString, Error> verify_token(const Settings& settings,
                                                  const QString& token,
                                                  const QDateTime& now);

/**
 * Extract the token from an "Authorization: Bearer <token>" header value.
 */
[[nodiscard]] Result<QString, Error> bearer_token(const QByteArray& authorization);

} // namespace qrhost::crypto
