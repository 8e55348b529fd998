#include "ai/resolution_client.hpp"

#include "logging/logging.hpp"

#include <QString>
#include <QThread>

#include <algorithm>

namespace mend::ai {
namespace {

QString describe(const ConflictRegion& region) {
    return QStringLiteral("%1:%2-%3")
        .arg(QString::fromStdString(region.file_path))
        .arg(region.start_line + 1)
        .arg(region.end_line + 1);
}

} // namespace

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            QThread::msleep(static_cast<unsigned long>(delay.count()));
        }
    };
}

ResolutionClient::ResolutionClient(CompletionService& service, const Settings& settings, Sleeper sleeper)
    : service_(service), settings_(settings), sleep_(std::move(sleeper)) {
}

int ResolutionClient::max_calls() const {
    return settings_.max_retries;
}

std::chrono::milliseconds ResolutionClient::backoff_after(int failed_calls) const {
    if (failed_calls <= 0 || settings_.retry_delay_ms <= 0) {
        return std::chrono::milliseconds{0};
    }
    long long delay = settings_.retry_delay_ms;
    for (int i = 1; i < failed_calls && delay < kMaxBackoff.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::min<long long>(delay, kMaxBackoff.count())};
}

CompletionRequest ResolutionClient::make_request(const ConflictRegion& region, const RegionContext& context) const {
    CompletionRequest request;
    request.system_prompt = kSystemPrompt;
    request.user_prompt = build_user_prompt(region, context);
    request.model = settings_.model;
    request.temperature = settings_.temperature;
    request.timeout = std::chrono::seconds{settings_.timeout_seconds};
    return request;
}

void ResolutionClient::resolve(ResolutionAttempt& attempt, const RegionContext& context) {
    if (attempt.is_terminal()) {
        return;
    }

    const int limit = max_calls();
    if (limit < 1) {
        attempt.fail(Error{"max_retries must be at least 1", ErrorKind::Config});
        return;
    }
    const auto request = make_request(attempt.region, context);
    const auto where = describe(attempt.region);

    std::optional<Error> last_error;
    while (attempt.attempt_count < limit) {
        ++attempt.attempt_count;
        qCInfo(mendAiLog) << "requesting resolution for" << where
                          << "attempt" << attempt.attempt_count << "of" << limit;

        auto reply = service_.complete(request);
        if (reply.is_ok()) {
            auto parsed = parse_response(reply.unwrap());
            if (parsed.low_confidence) {
                qCWarning(mendAiLog) << "no code block in response for" << where
                                     << "- using the raw answer";
            }
            attempt.succeed(std::move(parsed.candidate), parsed.low_confidence);
            return;
        }

        const auto& error = reply.unwrap_err();
        if (!error.is_retryable()) {
            qCWarning(mendAiLog) << "giving up on" << where << "after a"
                                 << QString::fromUtf8(to_string(error.kind).data(),
                                                      static_cast<int>(to_string(error.kind).size()))
                                 << ":" << QString::fromStdString(error.message);
            attempt.fail(error);
            return;
        }

        last_error = error;
        if (attempt.attempt_count < limit) {
            const auto delay = backoff_after(attempt.attempt_count);
            qCWarning(mendAiLog) << "attempt" << attempt.attempt_count << "for" << where << "failed:"
                                 << QString::fromStdString(error.message)
                                 << "- retrying in" << delay.count() << "ms";
            sleep_(delay);
        }
    }

    const auto message = "no resolution after " + std::to_string(attempt.attempt_count) +
                         " attempt(s): " + (last_error ? last_error->message : std::string("unknown error"));
    qCWarning(mendAiLog) << where << QString::fromStdString(message);
    attempt.fail(Error{message, ErrorKind::Transient});
}

ResolutionAttempt ResolutionClient::resolve(const ConflictRegion& region, const RegionContext& context) {
    ResolutionAttempt attempt(region);
    resolve(attempt, context);
    return attempt;
}

} // namespace mend::ai
