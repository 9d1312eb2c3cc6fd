#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QString>

#include <vector>

namespace qrhost::render {

constexpr int MIN_BOX_SIZE = 1;
constexpr int MAX_BOX_SIZE = 40;
constexpr int DEFAULT_BOX_SIZE = 10;
constexpr int DEFAULT_BORDER = 4;

/**
 * Module grid of an encoded QR symbol, quiet zone included.
 */
struct ModuleGrid {
    int side = 0;
    std::vector<bool> dark;  // row-major, side * side

    [[nodiscard]] bool at(int x, int y) const {
        return dark[static_cast<size_t>(y) * static_cast<size_t>(side) + static_cast<size_t>(x)];
    }
};

/**
 * QrRenderer - encodes text as a QR symbol and rasterises it.
 *
 * Every module becomes a box_size x box_size square, so the image side is
 * (modules + 2 * border) * box_size pixels.
 */
class QrRenderer {
public:
    QrRenderer(QColor fill, QColor back, int border = DEFAULT_BORDER);

    [[nodiscard]] Result<ModuleGrid, Error> encode(const QString& text) const;

    [[nodiscard]] Result<QImage, Error> render(const QString& text, int box_size) const;

    /**
     * Render and encode as PNG.
     */
    [[nodiscard]] Result<QByteArray, Error> render_png(const QString& text, int box_size) const;

private:
    QColor fill_;
    QColor back_;
    int border_;
};

} // namespace qrhost::render
