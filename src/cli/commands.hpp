#pragma once

#include <QString>

#include <vector>

#include "core/result.hpp"
#include "service/qr_code_service.hpp"

namespace qrhost::cli {

struct ListOptions {
    bool json = false;
};

// One line per stored code: "<filename>\t<url>". Stable order (by file name).
[[nodiscard]] QString format_code_list(const std::vector<service::QrCodeEntry>& entries);

// JSON output:
// [{ "filename", "url", "download_url" }]
[[nodiscard]] QString format_code_list_json(const std::vector<service::QrCodeEntry>& entries);

[[nodiscard]] Result<QString> run_list(const service::QrCodeService& service, const ListOptions& options);

// Creates one code without going through HTTP and returns its file path.
[[nodiscard]] Result<QString> run_generate(service::QrCodeService& service,
                                           const service::CreateRequest& request);

} // namespace qrhost::cli
