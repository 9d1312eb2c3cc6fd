#include "storage/qr_store.hpp"

#include "core/filename_codec.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace qrhost::storage {
namespace {

Error unsafe_name(const QString& filename) {
    return Error{"invalid file name: " + filename.toStdString(), ErrorKind::Invalid};
}

Error not_found(const QString& filename) {
    return Error{"QR code not found: " + filename.toStdString(), ErrorKind::NotFound};
}

} // namespace

QrStore::QrStore(QString directory)
    : directory_(std::move(directory))
{
}

Result<void, Error> QrStore::ensure_directory() const {
    QDir dir(directory_);
    if (!dir.mkpath(QStringLiteral("."))) {
        return Result<void, Error>::err(
            Error{"cannot create QR directory " + directory_.toStdString(), ErrorKind::Io});
    }
    qCInfo(qrhostStoreLog) << "QR directory:" << dir.absolutePath();
    return Result<void, Error>::ok();
}

QString QrStore::path_for(const QString& filename) const {
    return QDir(directory_).filePath(filename);
}

bool QrStore::exists(const QString& filename) const {
    if (!is_safe_filename(filename)) {
        return false;
    }
    const QFileInfo info(path_for(filename));
    return info.exists() && info.isFile();
}

Result<QStringList, Error> QrStore::list() const {
    QDir dir(directory_);
    if (!dir.exists()) {
        return Result<QStringList, Error>::err(
            Error{"QR directory missing: " + directory_.toStdString(), ErrorKind::Io});
    }
    const auto names = dir.entryList(QStringList{QStringLiteral("*.png")},
                                     QDir::Files | QDir::NoDotAndDotDot | QDir::CaseSensitive,
                                     QDir::Name);
    return Result<QStringList, Error>::ok(names);
}

Result<void, Error> QrStore::write(const QString& filename, const QByteArray& bytes) const {
    if (!is_safe_filename(filename)) {
        return Result<void, Error>::err(unsafe_name(filename));
    }

    QSaveFile file(path_for(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void, Error>::err(
            Error{"cannot open " + filename.toStdString() + ": " + file.errorString().toStdString(),
                  ErrorKind::Io});
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Result<void, Error>::err(
            Error{"short write to " + filename.toStdString(), ErrorKind::Io});
    }
    if (!file.commit()) {
        return Result<void, Error>::err(
            Error{"cannot commit " + filename.toStdString() + ": " + file.errorString().toStdString(),
                  ErrorKind::Io});
    }

    qCInfo(qrhostStoreLog) << "stored" << filename << bytes.size() << "bytes";
    return Result<void, Error>::ok();
}

Result<QByteArray, Error> QrStore::read(const QString& filename) const {
    if (!is_safe_filename(filename)) {
        return Result<QByteArray, Error>::err(unsafe_name(filename));
    }
    if (!exists(filename)) {
        return Result<QByteArray, Error>::err(not_found(filename));
    }

    QFile file(path_for(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray, Error>::err(
            Error{"cannot read " + filename.toStdString() + ": " + file.errorString().toStdString(),
                  ErrorKind::Io});
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<void, Error> QrStore::remove(const QString& filename) const {
    if (!is_safe_filename(filename)) {
        return Result<void, Error>::err(unsafe_name(filename));
    }
    if (!exists(filename)) {
        return Result<void, Error>::err(not_found(filename));
    }

    QFile file(path_for(filename));
    if (!file.remove()) {
        return Result<void, Error>::err(
            Error{"cannot delete " + filename.toStdString() + ": " + file.errorString().toStdString(),
                  ErrorKind::Io});
    }

    qCInfo(qrhostStoreLog) << "deleted" << filename;
    return Result<void, Error>::ok();
}

} // namespace qrhost::storage
