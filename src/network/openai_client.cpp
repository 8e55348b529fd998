#include "network/openai_client.hpp"

#include "logging/logging.hpp"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace mend::network {
namespace {

QJsonObject message(const char* role, const std::string& content) {
    QJsonObject obj;
    obj["role"] = QString::fromLatin1(role);
    obj["content"] = QString::fromStdString(content);
    return obj;
}

// Pulls error.message out of an OpenAI-style error body, if present.
QString service_error_detail(const QByteArray& body) {
    const auto doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const auto err = doc.object().value(QStringLiteral("error"));
        if (err.isObject()) {
            const auto msg = err.toObject().value(QStringLiteral("message")).toString();
            if (!msg.isEmpty()) return msg;
        }
    }
    return QString::fromUtf8(body.left(200)).trimmed();
}

} // namespace

QByteArray encode_chat_request(const ai::CompletionRequest& request) {
    QJsonArray messages;
    messages.append(message("system", request.system_prompt));
    messages.append(message("user", request.user_prompt));

    QJsonObject obj;
    obj["model"] = QString::fromStdString(request.model);
    obj["messages"] = messages;
    obj["temperature"] = request.temperature;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<std::string, Error> decode_chat_response(const QByteArray& body) {
    using Out = Result<std::string, Error>;

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        return Out::err(Error{"failed to parse API response: " + parse_error.errorString().toStdString(),
                              ErrorKind::Transient});
    }

    const auto choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        return Out::err(Error{"no resolution provided by the service", ErrorKind::Transient});
    }

    const auto content = choices.at(0).toObject()
                             .value(QStringLiteral("message")).toObject()
                             .value(QStringLiteral("content"));
    if (!content.isString()) {
        return Out::err(Error{"response has no message content", ErrorKind::Transient});
    }
    return Out::ok(content.toString().toStdString());
}

Error classify_http_failure(int status, const QByteArray& body) {
    const auto detail = service_error_detail(body).toStdString();
    const auto message = "API request failed with status " + std::to_string(status) +
                         (detail.empty() ? std::string{} : ": " + detail);

    if (status == 401 || status == 403) {
        return Error{message, ErrorKind::Credentials};
    }
    if (status == 408 || status == 429 || status >= 500) {
        return Error{message, ErrorKind::Transient};
    }
    return Error{message, ErrorKind::Permanent};
}

Error classify_network_error(QNetworkReply::NetworkError code, const QString& detail) {
    const auto message = "request failed: " + detail.toStdString();
    switch (code) {
        case QNetworkReply::AuthenticationRequiredError:
        case QNetworkReply::ProxyAuthenticationRequiredError:
            return Error{message, ErrorKind::Credentials};
        case QNetworkReply::ProtocolUnknownError:
        case QNetworkReply::ProtocolInvalidOperationError:
            return Error{message, ErrorKind::Permanent};
        default:
            // Refused, reset, DNS, TLS handshake, timeouts and the like.
            return Error{message, ErrorKind::Transient};
    }
}

OpenAiClient::OpenAiClient(const Settings& settings)
    : settings_(settings), nam_(std::make_unique<QNetworkAccessManager>()) {
}

OpenAiClient::~OpenAiClient() = default;

Result<std::string, Error> OpenAiClient::complete(const ai::CompletionRequest& request) {
    using Out = Result<std::string, Error>;

    if (!settings_.has_api_key()) {
        return Out::err(Error{"API key not set", ErrorKind::Credentials});
    }

    const QUrl url(QString::fromStdString(settings_.api_url));
    if (!url.isValid() || url.scheme().isEmpty()) {
        return Out::err(Error{"invalid API URL: " + settings_.api_url, ErrorKind::Permanent});
    }

    QNetworkRequest http(url);
    http.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    http.setRawHeader("Authorization", "Bearer " + QByteArray::fromStdString(*settings_.api_key));

    const auto body = encode_chat_request(request);
    qCDebug(mendNetworkLog) << "POST" << url.toString() << "bytes=" << body.size();

    std::unique_ptr<QNetworkReply, void (*)(QNetworkReply*)> reply(
        nam_->post(http, body), [](QNetworkReply* r) { r->deleteLater(); });

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(static_cast<int>(std::chrono::milliseconds(request.timeout).count()));

    bool timed_out = false;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, [&]() {
        timed_out = true;
        loop.quit();
    });

    timeout.start();
    if (!reply->isFinished()) {
        loop.exec();
    }
    timeout.stop();

    if (timed_out) {
        QObject::disconnect(reply.get(), nullptr, &loop, nullptr);
        reply->abort();
        return Out::err(Error{"request timed out after " + std::to_string(request.timeout.count()) + "s",
                              ErrorKind::Transient});
    }

    const auto status_attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const auto payload = reply->readAll();
    qCDebug(mendNetworkLog) << "response status=" << status_attr.toInt() << "bytes=" << payload.size();

    if (!status_attr.isValid()) {
        return Out::err(classify_network_error(reply->error(), reply->errorString()));
    }

    const int status = status_attr.toInt();
    if (status < 200 || status >= 300) {
        return Out::err(classify_http_failure(status, payload));
    }
    return decode_chat_response(payload);
}

} // namespace mend::network
