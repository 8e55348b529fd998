#pragma once

#include "core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mend {

/**
 * Settings - Resolved configuration for one run.
 *
 * Constructed once (defaults, then config files, then MEND_* environment
 * variables, then OPENAI_API_KEY) and passed by reference to the components
 * that need it. Tests build one directly with the values they want.
 */
struct Settings {
    static constexpr const char* kDefaultModel = "gpt-4";
    static constexpr const char* kDefaultApiUrl = "https://api.openai.com/v1/chat/completions";
    static constexpr const char* kEnvPrefix = "MEND_";
    static constexpr int kMaxTimeoutSeconds = 3600;

    std::optional<std::string> api_key;
    std::string model = kDefaultModel;
    int max_retries = 3;
    int timeout_seconds = 30;
    std::string api_url = kDefaultApiUrl;
    double temperature = 0.7;
    int context_lines = 3;
    int retry_delay_ms = 1000;

    [[nodiscard]] bool has_api_key() const { return api_key.has_value() && !api_key->empty(); }

    /**
     * Load from the standard locations: ./config.json, then the user config
     * file, then the environment.
     */
    [[nodiscard]] static Result<Settings, Error> load();

    /**
     * Load from an explicit list of config files (missing files are skipped),
     * then apply the environment. Later sources override earlier ones.
     */
    [[nodiscard]] static Result<Settings, Error> load_from(const std::vector<std::string>& config_files);

    /**
     * Write these settings as indented JSON, creating parent directories.
     */
    [[nodiscard]] Status save_to(const std::string& path) const;
    [[nodiscard]] Status save() const;

    // $HOME/.config/git-mend/config.json
    [[nodiscard]] static std::string user_config_path();
};

} // namespace mend
