#include "render/qr_renderer.hpp"

#include "core/logging.hpp"

#include <QBuffer>

#include <ZXing/BarcodeFormat.h>
#include <ZXing/BitMatrix.h>
#include <ZXing/CharacterSet.h>
#include <ZXing/MultiFormatWriter.h>

#include <exception>

namespace qrhost::render {

QrRenderer::QrRenderer(QColor fill, QColor back, int border)
    : fill_(std::move(fill))
    , back_(std::move(back))
    , border_(border < 0 ? 0 : border)
{
}

Result<ModuleGrid, Error> QrRenderer::encode(const QString& text) const {
    if (text.isEmpty()) {
        return Result<ModuleGrid, Error>::err(Error{"nothing to encode", ErrorKind::Invalid});
    }

    ZXing::BitMatrix matrix;
    try {
        ZXing::MultiFormatWriter writer(ZXing::BarcodeFormat::QRCode);
        writer.setEncoding(ZXing::CharacterSet::UTF8).setMargin(border_);
        // Width and height 0: one pixel per module, quiet zone added by the writer.
        matrix = writer.encode(text.toStdWString(), 0, 0);
    } catch (const std::exception& e) {
        qCWarning(qrhostRenderLog) << "QR encoding failed:" << e.what();
        return Result<ModuleGrid, Error>::err(
            Error{std::string("cannot encode QR code: ") + e.what(), ErrorKind::Invalid});
    }

    if (matrix.width() <= 0 || matrix.width() != matrix.height()) {
        return Result<ModuleGrid, Error>::err(Error{"encoder returned an empty symbol", ErrorKind::Internal});
    }

    ModuleGrid grid;
    grid.side = matrix.width();
    grid.dark.resize(static_cast<size_t>(grid.side) * static_cast<size_t>(grid.side));
    for (int y = 0; y < grid.side; ++y) {
        for (int x = 0; x < grid.side; ++x) {
            grid.dark[static_cast<size_t>(y) * static_cast<size_t>(grid.side) + static_cast<size_t>(x)] =
                matrix.get(x, y);
        }
    }
    return Result<ModuleGrid, Error>::ok(std::move(grid));
}

Result<QImage, Error> QrRenderer::render(const QString& text, int box_size) const {
    if (box_size < MIN_BOX_SIZE || box_size > MAX_BOX_SIZE) {
        return Result<QImage, Error>::err(Error{
            "box size must be between " + std::to_string(MIN_BOX_SIZE) + " and " +
                std::to_string(MAX_BOX_SIZE),
            ErrorKind::Invalid});
    }

    auto encoded = encode(text);
    if (encoded.is_err()) {
        return Result<QImage, Error>::err(encoded.unwrap_err());
    }
    const auto& grid = encoded.unwrap();

    const int side_px = grid.side * box_size;
    QImage image(side_px, side_px, QImage::Format_RGB32);
    if (image.isNull()) {
        return Result<QImage, Error>::err(Error{"cannot allocate image", ErrorKind::Internal});
    }

    const QRgb dark = fill_.rgb();
    const QRgb light = back_.rgb();
    for (int py = 0; py < side_px; ++py) {
        auto* line = reinterpret_cast<QRgb*>(image.scanLine(py));
        const int my = py / box_size;
        for (int px = 0; px < side_px; ++px) {
            line[px] = grid.at(px / box_size, my) ? dark : light;
        }
    }

    qCDebug(qrhostRenderLog) << "rendered" << grid.side << "modules at" << box_size << "px";
    return Result<QImage, Error>::ok(std::move(image));
}

Result<QByteArray, Error> QrRenderer::render_png(const QString& text, int box_size) const {
    auto image = render(text, box_size);
    if (image.is_err()) {
        return Result<QByteArray, Error>::err(image.unwrap_err());
    }

    QByteArray png;
    QBuffer buffer(&png);
    if (!buffer.open(QIODevice::WriteOnly) || !image.unwrap().save(&buffer, "PNG")) {
        return Result<QByteArray, Error>::err(Error{"PNG encoding failed", ErrorKind::Internal});
    }
    return Result<QByteArray, Error>::ok(std::move(png));
}

} // namespace qrhost::render
