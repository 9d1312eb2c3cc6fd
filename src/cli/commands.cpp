#include "cli/commands.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace qrhost::cli {

QString format_code_list(const std::vector<service::QrCodeEntry>& entries) {
    QStringList lines;
    lines.reserve(static_cast<qsizetype>(entries.size()));
    for (const auto& entry : entries) {
        lines.append(entry.filename + QLatin1Char('\t') + entry.target_url);
    }
    if (lines.isEmpty()) {
        return QString{};
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_code_list_json(const std::vector<service::QrCodeEntry>& entries) {
    QJsonArray arr;
    for (const auto& entry : entries) {
        QJsonObject obj;
        obj["filename"] = entry.filename;
        obj["url"] = entry.target_url;
        obj["download_url"] = entry.download_url;
        arr.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Indented));
}

Result<QString> run_list(const service::QrCodeService& service, const ListOptions& options) {
    auto entries = service.list();
    if (entries.is_err()) {
        return Result<QString>::err(entries.unwrap_err());
    }
    return Result<QString>::ok(options.json ? format_code_list_json(entries.unwrap())
                                            : format_code_list(entries.unwrap()));
}

Result<QString> run_generate(service::QrCodeService& service,
                             const service::CreateRequest& request) {
    auto created = service.create(request);
    if (created.is_err()) {
        return Result<QString>::err(created.unwrap_err());
    }
    return Result<QString>::ok(service.store().path_for(created.unwrap().filename));
}

} // namespace qrhost::cli
