#include "network/http_api.hpp"

#include "core/logging.hpp"
#include "crypto/token.hpp"

#include <QDateTime>
#include <QHttpHeaders>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

#include <cmath>

namespace qrhost::network {

using StatusCode = QHttpServerResponse::StatusCode;
using Method = QHttpServerRequest::Method;

namespace {

const char* method_name(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
        case Method::Post: return "POST";
        case Method::Head: return "HEAD";
        case Method::Options: return "OPTIONS";
        case Method::Patch: return "PATCH";
        case Method::Connect: return "CONNECT";
        case Method::Trace: return "TRACE";
        default: return "UNKNOWN";
    }
}

QHttpServerResponse detail_response(const QString& detail, StatusCode status) {
    QJsonObject body;
    body["detail"] = detail;
    return QHttpServerResponse(body, status);
}

void add_bearer_challenge(QHttpServerResponse& response) {
    QHttpHeaders headers = response.headers();
    headers.append(QHttpHeaders::WellKnownHeader::WWWAuthenticate, "Bearer");
    response.setHeaders(std::move(headers));
}

QJsonObject entry_json(const QString& message, const QString& qr_code_url,
                       const std::vector<service::Link>& links) {
    QJsonObject obj;
    obj["message"] = message;
    obj["qr_code_url"] = qr_code_url;
    obj["links"] = service::to_json(links);
    return obj;
}

QString form_value(const QUrlQuery& form, const char* key) {
    return form.queryItemValue(QString::fromLatin1(key), QUrl::FullyDecoded);
}

} // namespace

StatusCode status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Invalid: return StatusCode::UnprocessableEntity;
        case ErrorKind::NotFound: return StatusCode::NotFound;
        case ErrorKind::Conflict: return StatusCode::Conflict;
        case ErrorKind::Unauthorized: return StatusCode::Unauthorized;
        case ErrorKind::Io: return StatusCode::InternalServerError;
        case ErrorKind::Internal: return StatusCode::InternalServerError;
    }
    return StatusCode::InternalServerError;
}

QHttpServerResponse error_response(const Error& error) {
    auto response = detail_response(QString::fromStdString(error.message), status_for(error.kind));
    if (error.kind == ErrorKind::Unauthorized) {
        add_bearer_challenge(response);
    }
    return response;
}

Result<service::CreateRequest, Error> parse_create_request(const QByteArray& body) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<service::CreateRequest, Error>::err(
            Error{"request body must be a JSON object", ErrorKind::Invalid});
    }

    const auto obj = doc.object();
    const auto url = obj.value("url");
    if (!url.isString() || url.toString().isEmpty()) {
        return Result<service::CreateRequest, Error>::err(
            Error{"field 'url' is required", ErrorKind::Invalid});
    }

    service::CreateRequest request;
    request.url = url.toString();

    if (obj.contains("size") && !obj.value("size").isNull()) {
        const auto size = obj.value("size");
        const double raw = size.toDouble();
        if (!size.isDouble() || std::floor(raw) != raw) {
            return Result<service::CreateRequest, Error>::err(
                Error{"field 'size' must be an integer", ErrorKind::Invalid});
        }
        if (raw < render::MIN_BOX_SIZE || raw > render::MAX_BOX_SIZE) {
            return Result<service::CreateRequest, Error>::err(Error{
                "field 'size' must be between " + std::to_string(render::MIN_BOX_SIZE) + " and " +
                    std::to_string(render::MAX_BOX_SIZE),
                ErrorKind::Invalid});
        }
        request.size = static_cast<int>(raw);
    }
    return Result<service::CreateRequest, Error>::ok(std::move(request));
}

// ============================================================================
// HttpApi
// ============================================================================

HttpApi::HttpApi(service::QrCodeService& service, QObject* parent)
    : QObject(parent)
    , service_(service)
    , http_(std::make_unique<QHttpServer>())
{
    registerRoutes();
}

HttpApi::~HttpApi() {
    close();
}

void HttpApi::registerRoutes() {
    auto check = [this](bool ok, const char* pattern) {
        if (!ok) {
            qCCritical(qrhostHttpLog) << "failed to register route" << pattern;
            routes_ok_ = false;
        }
    };

    check(static_cast<bool>(http_->route(QStringLiteral("/token"), Method::Post,
                       [this](const QHttpServerRequest& request) {
                           return handleToken(request);
                       })),
          "/token");

    for (const auto& collection : {QStringLiteral("/qr-codes/"), QStringLiteral("/qr-codes")}) {
        check(static_cast<bool>(http_->route(collection, Method::Post,
                           [this](const QHttpServerRequest& request) {
                               return handleCreate(request);
                           })),
              "POST /qr-codes/");
        check(static_cast<bool>(http_->route(collection, Method::Get,
                           [this](const QHttpServerRequest& request) {
                               return handleList(request);
                           })),
              "GET /qr-codes/");
    }

    check(static_cast<bool>(http_->route(QStringLiteral("/qr-codes/<arg>"), Method::Get,
                       [this](const QString& filename, const QHttpServerRequest& request) {
                           return handleRetrieve(filename, request);
                       })),
          "GET /qr-codes/<filename>");

    check(static_cast<bool>(http_->route(QStringLiteral("/qr-codes/<arg>"), Method::Delete,
                       [this](const QString& filename, const QHttpServerRequest& request) {
                           return handleDelete(filename, request);
                       })),
          "DELETE /qr-codes/<filename>");

    check(static_cast<bool>(http_->route(QStringLiteral("/health"), Method::Get,
                       []() {
                           QJsonObject body;
                           body["status"] = QStringLiteral("ok");
                           return QHttpServerResponse(body);
                       })),
          "/health");

    http_->addAfterRequestHandler(this, [](const QHttpServerRequest& request,
                                           QHttpServerResponse& response) {
        qCInfo(qrhostHttpLog).noquote()
            << method_name(request.method()) << request.url().path()
            << static_cast<int>(response.statusCode());
    });
}

Result<uint16_t, Error> HttpApi::listen(const QHostAddress& address, uint16_t port) {
    if (!routes_ok_) {
        return Result<uint16_t, Error>::err(Error{"route registration failed", ErrorKind::Internal});
    }
    if (tcp_ && tcp_->isListening()) {
        return Result<uint16_t, Error>::err(Error{"already listening", ErrorKind::Internal});
    }

    auto* tcp = new QTcpServer(http_.get());
    if (!tcp->listen(address, port)) {
        const auto message = tcp->errorString().toStdString();
        delete tcp;
        return Result<uint16_t, Error>::err(Error{message, ErrorKind::Io});
    }
    if (!http_->bind(tcp)) {
        delete tcp;
        return Result<uint16_t, Error>::err(Error{"cannot bind HTTP server", ErrorKind::Internal});
    }
    tcp_ = tcp;

    qCInfo(qrhostHttpLog) << "listening on" << address.toString() << tcp_->serverPort();
    return Result<uint16_t, Error>::ok(tcp_->serverPort());
}

void HttpApi::close() {
    if (tcp_) {
        tcp_->close();
    }
}

Result<QString, Error> HttpApi::authenticate(const QHttpServerRequest& request) const {
    const auto header = request.headers()
        .value(QHttpHeaders::WellKnownHeader::Authorization)
        .toByteArray();

    auto token = crypto::bearer_token(header);
    if (token.is_err()) {
        return token;
    }

    auto subject = crypto::verify_token(service_.settings(), token.unwrap(),
                                        QDateTime::currentDateTimeUtc());
    if (subject.is_err()) {
        qCDebug(qrhostAuthLog) << "token rejected:" << subject.unwrap_err().message.c_str();
        return Result<QString, Error>::err(
            Error{"Could not validate credentials", ErrorKind::Unauthorized});
    }
    return subject;
}

QHttpServerResponse HttpApi::handleToken(const QHttpServerRequest& request) {
    auto body = request.body();
    body.replace('+', ' ');
    const QUrlQuery form(QString::fromUtf8(body));

    const auto username = form_value(form, "username");
    const auto password = form_value(form, "password");

    if (username.isEmpty() || password.isEmpty() ||
        !crypto::check_credentials(service_.settings(), username, password)) {
        qCInfo(qrhostAuthLog) << "login failed for" << username;
        return error_response(Error{"Incorrect username or password", ErrorKind::Unauthorized});
    }

    QJsonObject reply;
    reply["access_token"] = crypto::issue_token(service_.settings(), username,
                                                QDateTime::currentDateTimeUtc());
    reply["token_type"] = QStringLiteral("bearer");
    qCInfo(qrhostAuthLog) << "issued token for" << username;
    return QHttpServerResponse(reply);
}

QHttpServerResponse HttpApi::handleCreate(const QHttpServerRequest& request) {
    auto auth = authenticate(request);
    if (auth.is_err()) {
        return error_response(auth.unwrap_err());
    }

    auto parsed = parse_create_request(request.body());
    if (parsed.is_err()) {
        return error_response(parsed.unwrap_err());
    }

    auto created = service_.create(parsed.unwrap());
    if (created.is_err()) {
        const auto& error = created.unwrap_err();
        if (error.kind != ErrorKind::Conflict) {
            if (error.kind == ErrorKind::Io || error.kind == ErrorKind::Internal) {
                qCWarning(qrhostHttpLog) << "create failed:" << error.message.c_str();
            }
            return error_response(error);
        }

        auto existing = service_.describe(parsed.unwrap().url);
        if (existing.is_err()) {
            return error_response(existing.unwrap_err());
        }
        QJsonObject body;
        body["message"] = QStringLiteral("QR code already exists.");
        body["links"] = service::to_json(
            service_.links_for(service::LinkAction::Create, existing.unwrap()));
        return QHttpServerResponse(body, StatusCode::Conflict);
    }

    const auto& entry = created.unwrap();
    return QHttpServerResponse(
        entry_json(QStringLiteral("QR code created successfully."), entry.download_url,
                   service_.links_for(service::LinkAction::Create, entry)),
        StatusCode::Created);
}

QHttpServerResponse HttpApi::handleList(const QHttpServerRequest& request) {
    auto auth = authenticate(request);
    if (auth.is_err()) {
        return error_response(auth.unwrap_err());
    }

    qCInfo(qrhostHttpLog) << "Listing all QR codes.";
    auto entries = service_.list();
    if (entries.is_err()) {
        qCWarning(qrhostHttpLog) << "list failed:" << entries.unwrap_err().message.c_str();
        return error_response(entries.unwrap_err());
    }

    QJsonArray body;
    for (const auto& entry : entries.unwrap()) {
        body.append(entry_json(QStringLiteral("QR code available"), entry.target_url,
                               service_.links_for(service::LinkAction::List, entry)));
    }
    return QHttpServerResponse(body);
}

QHttpServerResponse HttpApi::handleRetrieve(const QString& filename, const QHttpServerRequest& request) {
    auto auth = authenticate(request);
    if (auth.is_err()) {
        return error_response(auth.unwrap_err());
    }

    auto bytes = service_.read(filename);
    if (bytes.is_err()) {
        const auto& error = bytes.unwrap_err();
        if (error.kind == ErrorKind::NotFound || error.kind == ErrorKind::Invalid) {
            return detail_response(QStringLiteral("QR code not found"), StatusCode::NotFound);
        }
        qCWarning(qrhostHttpLog) << "read failed:" << error.message.c_str();
        return error_response(error);
    }
    return QHttpServerResponse(QByteArrayLiteral("image/png"), bytes.unwrap());
}

QHttpServerResponse HttpApi::handleDelete(const QString& filename, const QHttpServerRequest& request) {
    auto auth = authenticate(request);
    if (auth.is_err()) {
        return error_response(auth.unwrap_err());
    }

    auto removed = service_.remove(filename);
    if (removed.is_err()) {
        const auto& error = removed.unwrap_err();
        if (error.kind == ErrorKind::NotFound || error.kind == ErrorKind::Invalid) {
            return detail_response(QStringLiteral("QR code not found"), StatusCode::NotFound);
        }
        qCWarning(qrhostHttpLog) << "delete failed:" << error.message.c_str();
        return error_response(error);
    }
    return QHttpServerResponse(StatusCode::NoContent);
}

} // namespace qrhost::network
