#include "core/filename_codec.hpp"

#include <QByteArray>

namespace qrhost {

QString encode_url_to_filename(const QString& url) {
    const auto encoded = url.toUtf8().toBase64(
        QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
    return QString::fromLatin1(encoded);
}

Result<QString, Error> decode_filename_to_url(const QString& stem) {
    if (stem.isEmpty()) {
        return Result<QString, Error>::err(Error{"empty file name", ErrorKind::Invalid});
    }

    QByteArray padded = stem.toLatin1();
    if (padded.size() % 4 == 1) {
        return Result<QString, Error>::err(Error{"truncated base64 file name", ErrorKind::Invalid});
    }
    while (padded.size() % 4 != 0) {
        padded.append('=');
    }

    const auto decoded = QByteArray::fromBase64Encoding(
        padded, QByteArray::Base64UrlEncoding | QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return Result<QString, Error>::err(Error{"file name is not url-safe base64", ErrorKind::Invalid});
    }
    auto url = QString::fromUtf8(*decoded);
    // Only names this codec produces map back to a URL.
    if (encode_url_to_filename(url) != stem) {
        return Result<QString, Error>::err(Error{"file name is not a canonical url encoding", ErrorKind::Invalid});
    }
    return Result<QString, Error>::ok(std::move(url));
}

bool is_safe_filename(const QString& name) {
    if (name.isEmpty()) return false;
    if (name.startsWith(QLatin1Char('.'))) return false;
    if (name.contains(QLatin1Char('/')) || name.contains(QLatin1Char('\\'))) return false;
    if (name.contains(QChar(u'\0'))) return false;
    return true;
}

} // namespace qrhost
