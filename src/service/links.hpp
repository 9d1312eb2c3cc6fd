#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <vector>

namespace qrhost::service {

enum class LinkAction {
    List,
    Create,
    Delete
};

/**
 * Hypermedia link attached to QR code responses.
 */
struct Link {
    QString rel;
    QString href;
    QString action;  // HTTP method
    QString type;    // media type of the target

    bool operator==(const Link& other) const = default;
};

std::vector<Link> generate_links(LinkAction action,
                                 const QString& filename,
                                 const QString& base_url,
                                 const QString& download_url);

QJsonObject to_json(const Link& link);
QJsonArray to_json(const std::vector<Link>& links);

} // namespace qrhost::service
