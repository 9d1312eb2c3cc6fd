#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "render/qr_renderer.hpp"
#include "service/links.hpp"
#include "storage/qr_store.hpp"

#include <QByteArray>
#include <QString>

#include <vector>

namespace qrhost::service {

struct CreateRequest {
    QString url;
    int size = render::DEFAULT_BOX_SIZE;
};

/**
 * One stored (or to-be-stored) QR code.
 */
struct QrCodeEntry {
    QString filename;      // "<base64url(url)>.png"
    QString target_url;    // the URL the code points to
    QString download_url;  // where the proxy serves the image
};

/**
 * QrCodeService - QR code operations independent of the HTTP transport.
 */
class QrCodeService {
public:
    QrCodeService(Settings settings, storage::QrStore store);

    /**
     * Validate url and compute where its image lives.
     */
    [[nodiscard]] Result<QrCodeEntry, Error> describe(const QString& url) const;

    /**
     * Render and store a new code. An already stored URL is a Conflict.
     */
    Result<QrCodeEntry, Error> create(const CreateRequest& request);

    [[nodiscard]] Result<std::vector<QrCodeEntry>, Error> list() const;

    [[nodiscard]] Result<QByteArray, Error> read(const QString& filename) const;

    Result<void, Error> remove(const QString& filename);

    [[nodiscard]] std::vector<Link> links_for(LinkAction action, const QrCodeEntry& entry) const;

    [[nodiscard]] const Settings& settings() const { return settings_; }
    [[nodiscard]] const storage::QrStore& store() const { return store_; }

private:
    Settings settings_;
    storage::QrStore store_;
    render::QrRenderer renderer_;
};

// Absolute http(s) URL with a host.
[[nodiscard]] bool is_valid_target_url(const QString& url);

} // namespace qrhost::service
