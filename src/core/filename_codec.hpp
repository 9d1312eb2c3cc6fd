#pragma once

#include "core/result.hpp"

#include <QString>

namespace qrhost {

// Longest stem that still fits a 255-byte file name once ".png" is appended.
constexpr int MAX_FILENAME_STEM = 251;

/**
 * URL-safe base64 of the UTF-8 bytes of url, without '=' padding.
 * The mapping is deterministic, so a URL always lands in the same file.
 */
[[nodiscard]] QString encode_url_to_filename(const QString& url);

/**
 * Inverse of encode_url_to_filename. The stem must not carry the extension.
 */
[[nodiscard]] Result<QString, Error> decode_filename_to_url(const QString& stem);

// Rejects names that could escape the QR directory or address hidden files.
[[nodiscard]] bool is_safe_filename(const QString& name);

} // namespace qrhost
