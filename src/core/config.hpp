#pragma once

#include "core/result.hpp"

#include <QColor>
#include <QHash>
#include <QString>
#include <cstdint>

namespace qrhost {

/**
 * Settings - runtime configuration of the service.
 *
 * Values come from the process environment (see load_settings) and may be
 * overridden afterwards by command-line options.
 */
struct Settings {
    QString qr_directory = QStringLiteral("./qr_codes");
    QString fill_color = QStringLiteral("red");
    QString back_color = QStringLiteral("white");
    QString server_base_url = QStringLiteral("http://localhost:80");
    QString download_folder = QStringLiteral("downloads");

    QString secret_key = QStringLiteral("a_very_secret_key");
    QString algorithm = QStringLiteral("HS256");
    int access_token_expire_minutes = 30;
    QString admin_user = QStringLiteral("admin");
    QString admin_password = QStringLiteral("secret");

    QString listen_host = QStringLiteral("0.0.0.0");
    uint16_t listen_port = 8000;
    QString log_file;

    /**
     * Public URL under which the proxy serves a stored file.
     */
    [[nodiscard]] QString download_url_for(const QString& filename) const;

    [[nodiscard]] QColor fill() const { return QColor::fromString(fill_color); }
    [[nodiscard]] QColor back() const { return QColor::fromString(back_color); }
};

using Environment = QHash<QString, QString>;

// Snapshot of the variables load_settings understands, read from the process.
Environment process_environment();

/**
 * Build Settings from an environment snapshot. Unset variables keep their
 * defaults; set ones are taken verbatim apart from URL slash normalisation.
 */
Result<Settings, Error> load_settings(const Environment& env);

/**
 * Re-check a Settings value after command-line overrides were applied.
 */
Result<void, Error> validate_settings(const Settings& settings);

} // namespace qrhost
