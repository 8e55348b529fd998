#pragma once

#include "ai/completion_service.hpp"
#include "config/settings.hpp"

#include <QByteArray>
#include <QNetworkReply>
#include <QString>

#include <memory>

class QNetworkAccessManager;

namespace mend::network {

/**
 * OpenAiClient - Chat-completions transport over HTTP.
 *
 * POSTs {model, messages, temperature} to settings.api_url with a bearer
 * token and returns choices[0].message.content. Each call blocks in a local
 * event loop until the reply finishes or the request timeout fires; a
 * timeout aborts the reply and is reported as a Transient failure.
 */
class OpenAiClient final : public ai::CompletionService {
public:
    explicit OpenAiClient(const Settings& settings);
    ~OpenAiClient() override;

    OpenAiClient(const OpenAiClient&) = delete;
    OpenAiClient& operator=(const OpenAiClient&) = delete;

    [[nodiscard]] Result<std::string, Error> complete(const ai::CompletionRequest& request) override;

private:
    const Settings& settings_;
    std::unique_ptr<QNetworkAccessManager> nam_;
};

// Wire helpers, kept separate so they can be tested without sockets.

[[nodiscard]] QByteArray encode_chat_request(const ai::CompletionRequest& request);

[[nodiscard]] Result<std::string, Error> decode_chat_response(const QByteArray& body);

// 401/403 -> Credentials, 408/429/5xx -> Transient, other statuses -> Permanent.
[[nodiscard]] Error classify_http_failure(int status, const QByteArray& body);

// Connection-level failures (no HTTP status) are Transient unless the
// request itself could never succeed.
[[nodiscard]] Error classify_network_error(QNetworkReply::NetworkError code, const QString& detail);

} // namespace mend::network
