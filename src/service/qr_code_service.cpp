#include "service/qr_code_service.hpp"

#include "core/filename_codec.hpp"
#include "core/logging.hpp"

#include <QUrl>

namespace qrhost::service {
namespace {

const QString kPngSuffix = QStringLiteral(".png");

} // namespace

bool is_valid_target_url(const QString& url) {
    const QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative()) {
        return false;
    }
    const auto scheme = parsed.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) {
        return false;
    }
    return !parsed.host().isEmpty();
}

QrCodeService::QrCodeService(Settings settings, storage::QrStore store)
    : settings_(std::move(settings))
    , store_(std::move(store))
    , renderer_(settings_.fill(), settings_.back())
{
}

Result<QrCodeEntry, Error> QrCodeService::describe(const QString& url) const {
    if (!is_valid_target_url(url)) {
        return Result<QrCodeEntry, Error>::err(
            Error{"url must be an absolute http or https URL", ErrorKind::Invalid});
    }

    const auto stem = encode_url_to_filename(url);
    if (stem.size() > MAX_FILENAME_STEM) {
        return Result<QrCodeEntry, Error>::err(Error{"URL too long", ErrorKind::Invalid});
    }

    QrCodeEntry entry;
    entry.filename = stem + kPngSuffix;
    entry.target_url = url;
    entry.download_url = settings_.download_url_for(entry.filename);
    return Result<QrCodeEntry, Error>::ok(std::move(entry));
}

Result<QrCodeEntry, Error> QrCodeService::create(const CreateRequest& request) {
    qCInfo(qrhostHttpLog) << "Creating QR code for URL:" << request.url;

    if (request.size < render::MIN_BOX_SIZE || request.size > render::MAX_BOX_SIZE) {
        return Result<QrCodeEntry, Error>::err(Error{
            "size must be between " + std::to_string(render::MIN_BOX_SIZE) + " and " +
                std::to_string(render::MAX_BOX_SIZE),
            ErrorKind::Invalid});
    }

    auto described = describe(request.url);
    if (described.is_err()) {
        return described;
    }
    auto entry = std::move(described).unwrap();

    if (store_.exists(entry.filename)) {
        return Result<QrCodeEntry, Error>::err(Error{"QR code already exists.", ErrorKind::Conflict});
    }

    auto png = renderer_.render_png(request.url, request.size);
    if (png.is_err()) {
        return Result<QrCodeEntry, Error>::err(png.unwrap_err());
    }

    auto written = store_.write(entry.filename, png.unwrap());
    if (written.is_err()) {
        return Result<QrCodeEntry, Error>::err(written.unwrap_err());
    }
    return Result<QrCodeEntry, Error>::ok(std::move(entry));
}

Result<std::vector<QrCodeEntry>, Error> QrCodeService::list() const {
    auto names = store_.list();
    if (names.is_err()) {
        return Result<std::vector<QrCodeEntry>, Error>::err(names.unwrap_err());
    }

    std::vector<QrCodeEntry> entries;
    for (const auto& name : names.unwrap()) {
        const auto stem = name.chopped(kPngSuffix.size());
        auto url = decode_filename_to_url(stem);
        if (url.is_err()) {
            qCWarning(qrhostStoreLog) << "skipping" << name << ":" << url.unwrap_err().message.c_str();
            continue;
        }

        QrCodeEntry entry;
        entry.filename = name;
        entry.target_url = url.unwrap();
        entry.download_url = settings_.download_url_for(name);
        entries.push_back(std::move(entry));
    }
    return Result<std::vector<QrCodeEntry>, Error>::ok(std::move(entries));
}

Result<QByteArray, Error> QrCodeService::read(const QString& filename) const {
    return store_.read(filename);
}

Result<void, Error> QrCodeService::remove(const QString& filename) {
    qCInfo(qrhostHttpLog) << "Deleting QR code:" << filename;
    return store_.remove(filename);
}

std::vector<Link> QrCodeService::links_for(LinkAction action, const QrCodeEntry& entry) const {
    return generate_links(action, entry.filename, settings_.server_base_url, entry.download_url);
}

} // namespace qrhost::service
