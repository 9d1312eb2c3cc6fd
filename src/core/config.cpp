#include "core/config.hpp"

#include "core/logging.hpp"

#include <QProcessEnvironment>

namespace qrhost {
namespace {

const QStringList& known_variables() {
    static const QStringList vars{
        QStringLiteral("QR_CODE_DIR"),
        QStringLiteral("FILL_COLOR"),
        QStringLiteral("BACK_COLOR"),
        QStringLiteral("SERVER_BASE_URL"),
        QStringLiteral("SERVER_DOWNLOAD_FOLDER"),
        QStringLiteral("SECRET_KEY"),
        QStringLiteral("ALGORITHM"),
        QStringLiteral("ACCESS_TOKEN_EXPIRE_MINUTES"),
        QStringLiteral("ADMIN_USER"),
        QStringLiteral("ADMIN_PASSWORD"),
        QStringLiteral("QRHOST_HOST"),
        QStringLiteral("QRHOST_PORT"),
        QStringLiteral("QRHOST_LOG_FILE"),
    };
    return vars;
}

Error invalid(const QString& variable, const QString& why) {
    return Error{QStringLiteral("%1: %2").arg(variable, why).toStdString(), ErrorKind::Invalid};
}

QString strip_slashes(QString value, bool leading) {
    while (value.endsWith(QLatin1Char('/'))) {
        value.chop(1);
    }
    while (leading && value.startsWith(QLatin1Char('/'))) {
        value.remove(0, 1);
    }
    return value;
}

} // namespace

QString Settings::download_url_for(const QString& filename) const {
    return QStringLiteral("%1/%2/%3").arg(server_base_url, download_folder, filename);
}

Environment process_environment() {
    const auto sys = QProcessEnvironment::systemEnvironment();
    Environment env;
    for (const auto& name : known_variables()) {
        if (sys.contains(name)) {
            env.insert(name, sys.value(name));
        }
    }
    return env;
}

Result<Settings, Error> load_settings(const Environment& env) {
    Settings s;

    auto take = [&env](const char* name, QString& out) {
        const auto key = QString::fromLatin1(name);
        if (env.contains(key)) {
            out = env.value(key);
        }
    };

    take("QR_CODE_DIR", s.qr_directory);
    take("FILL_COLOR", s.fill_color);
    take("BACK_COLOR", s.back_color);
    take("SERVER_BASE_URL", s.server_base_url);
    take("SERVER_DOWNLOAD_FOLDER", s.download_folder);
    take("SECRET_KEY", s.secret_key);
    take("ALGORITHM", s.algorithm);
    take("ADMIN_USER", s.admin_user);
    take("ADMIN_PASSWORD", s.admin_password);
    take("QRHOST_HOST", s.listen_host);
    take("QRHOST_LOG_FILE", s.log_file);

    s.server_base_url = strip_slashes(s.server_base_url, false);
    s.download_folder = strip_slashes(s.download_folder, true);

    const auto expiry_key = QStringLiteral("ACCESS_TOKEN_EXPIRE_MINUTES");
    if (env.contains(expiry_key)) {
        bool ok = false;
        const int minutes = env.value(expiry_key).trimmed().toInt(&ok);
        if (!ok || minutes <= 0) {
            return Result<Settings, Error>::err(
                invalid(expiry_key, QStringLiteral("expected a positive integer")));
        }
        s.access_token_expire_minutes = minutes;
    }

    const auto port_key = QStringLiteral("QRHOST_PORT");
    if (env.contains(port_key)) {
        bool ok = false;
        const int port = env.value(port_key).trimmed().toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            return Result<Settings, Error>::err(
                invalid(port_key, QStringLiteral("expected a port number")));
        }
        s.listen_port = static_cast<uint16_t>(port);
    }

    auto checked = validate_settings(s);
    if (checked.is_err()) {
        return Result<Settings, Error>::err(checked.unwrap_err());
    }

    qCDebug(qrhostConfigLog) << "settings loaded: dir=" << s.qr_directory
                             << "fill=" << s.fill_color << "back=" << s.back_color;
    return Result<Settings, Error>::ok(std::move(s));
}

Result<void, Error> validate_settings(const Settings& settings) {
    if (settings.qr_directory.isEmpty()) {
        return Result<void, Error>::err(invalid(QStringLiteral("QR_CODE_DIR"),
                                                QStringLiteral("must not be empty")));
    }
    if (!QColor::isValidColorName(settings.fill_color)) {
        return Result<void, Error>::err(invalid(QStringLiteral("FILL_COLOR"),
            QStringLiteral("unknown color '%1'").arg(settings.fill_color)));
    }
    if (!QColor::isValidColorName(settings.back_color)) {
        return Result<void, Error>::err(invalid(QStringLiteral("BACK_COLOR"),
            QStringLiteral("unknown color '%1'").arg(settings.back_color)));
    }
    if (settings.algorithm != QStringLiteral("HS256")) {
        return Result<void, Error>::err(invalid(QStringLiteral("ALGORITHM"),
            QStringLiteral("unsupported algorithm '%1'").arg(settings.algorithm)));
    }
    if (settings.secret_key.isEmpty()) {
        return Result<void, Error>::err(invalid(QStringLiteral("SECRET_KEY"),
                                                QStringLiteral("must not be empty")));
    }
    if (settings.access_token_expire_minutes <= 0) {
        return Result<void, Error>::err(invalid(QStringLiteral("ACCESS_TOKEN_EXPIRE_MINUTES"),
                                                QStringLiteral("must be positive")));
    }
    return Result<void, Error>::ok();
}

} // namespace qrhost
