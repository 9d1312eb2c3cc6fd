#include "service/links.hpp"

namespace qrhost::service {

std::vector<Link> generate_links(LinkAction action,
                                 const QString& filename,
                                 const QString& base_url,
                                 const QString& download_url) {
    std::vector<Link> links;
    if (action == LinkAction::List || action == LinkAction::Create) {
        links.push_back(Link{
            .rel = QStringLiteral("view"),
            .href = download_url,
            .action = QStringLiteral("GET"),
            .type = QStringLiteral("image/png"),
        });
    }
    // Every action can be followed by a delete.
    links.push_back(Link{
        .rel = QStringLiteral("delete"),
        .href = QStringLiteral("%1/qr-codes/%2").arg(base_url, filename),
        .action = QStringLiteral("DELETE"),
        .type = QStringLiteral("application/json"),
    });
    return links;
}

QJsonObject to_json(const Link& link) {
    QJsonObject obj;
    obj["rel"] = link.rel;
    obj["href"] = link.href;
    obj["action"] = link.action;
    obj["type"] = link.type;
    return obj;
}

QJsonArray to_json(const std::vector<Link>& links) {
    QJsonArray arr;
    for (const auto& link : links) {
        arr.append(to_json(link));
    }
    return arr;
}

} // namespace qrhost::service
