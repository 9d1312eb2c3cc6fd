#pragma once

#include "core/result.hpp"
#include "service/qr_code_service.hpp"

#include <QHostAddress>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QObject>
#include <QTcpServer>

#include <memory>

namespace qrhost::network {

/**
 * HttpApi - the REST surface of the service.
 *
 * Routes:
 *   POST   /token                  password login, returns a bearer token
 *   POST   /qr-codes/              create a QR code        (bearer)
 *   GET    /qr-codes/              list stored QR codes    (bearer)
 *   GET    /qr-codes/<filename>    PNG bytes               (bearer)
 *   DELETE /qr-codes/<filename>    delete a QR code        (bearer)
 *   GET    /health                 liveness probe
 */
class HttpApi : public QObject {
    Q_OBJECT

public:
    explicit HttpApi(service::QrCodeService& service, QObject* parent = nullptr);
    ~HttpApi() override;

    /**
     * Start listening.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(const QHostAddress& address, uint16_t port);

    void close();

private:
    service::QrCodeService& service_;
    std::unique_ptr<QHttpServer> http_;
    QTcpServer* tcp_ = nullptr;  // parented to http_
    bool routes_ok_ = true;

    void registerRoutes();

    Result<QString, Error> authenticate(const QHttpServerRequest& request) const;

    QHttpServerResponse handleToken(const QHttpServerRequest& request);
    QHttpServerResponse handleCreate(const QHttpServerRequest& request);
    QHttpServerResponse handleList(const QHttpServerRequest& request);
    QHttpServerResponse handleRetrieve(const QString& filename, const QHttpServerRequest& request);
    QHttpServerResponse handleDelete(const QString& filename, const QHttpServerRequest& request);
};

/**
 * Map an error kind onto the HTTP status reported to clients.
 */
QHttpServerResponse::StatusCode status_for(ErrorKind kind);

/**
 * {"detail": message} with the status for error.kind; 401 responses also
 * carry "WWW-Authenticate: Bearer".
 */
QHttpServerResponse error_response(const Error& error);

/**
 * Parse a create request body: {"url": string, "size": integer (optional)}.
 */
Result<service::CreateRequest, Error> parse_create_request(const QByteArray& body);

} // namespace qrhost::network
