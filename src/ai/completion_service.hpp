#pragma once

#include "core/result.hpp"

#include <chrono>
#include <string>

namespace mend::ai {

/**
 * CompletionRequest - One prompt for the completion service.
 */
struct CompletionRequest {
    std::string system_prompt;
    std::string user_prompt;
    std::string model;
    double temperature = 0.7;
    std::chrono::seconds timeout{30};
};

/**
 * CompletionService - Prompt in, text or classified error out.
 *
 * Implementations classify failures as ErrorKind::Transient (may succeed if
 * retried), ErrorKind::Permanent (will fail again) or ErrorKind::Credentials
 * (authentication rejected). They never retry on their own.
 */
class CompletionService {
public:
    virtual ~CompletionService() = default;

    [[nodiscard]] virtual Result<std::string, Error> complete(const CompletionRequest& request) = 0;
};

} // namespace mend::ai
