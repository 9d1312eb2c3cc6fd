#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace qrhost::storage {

/**
 * QrStore - the directory of PNG files shared with the static file proxy.
 *
 * Writes go through a temporary file that is renamed into place, so a reader
 * of the same directory sees either no file or the complete image.
 */
class QrStore {
public:
    explicit QrStore(QString directory);

    /**
     * Create the directory (and parents) if missing.
     */
    Result<void, Error> ensure_directory() const;

    [[nodiscard]] const QString& directory() const { return directory_; }

    [[nodiscard]] QString path_for(const QString& filename) const;

    [[nodiscard]] bool exists(const QString& filename) const;

    /**
     * Names of stored PNG files, sorted.
     */
    Result<QStringList, Error> list() const;

    Result<void, Error> write(const QString& filename, const QByteArray& bytes) const;

    Result<QByteArray, Error> read(const QString& filename) const;

    Result<void, Error> remove(const QString& filename) const;

private:
    QString directory_;
};

} // namespace qrhost::storage
