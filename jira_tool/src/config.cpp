#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

bool Credentials::complete() const {
    return missing().empty();
}

std::vector<std::string> Credentials::missing() const {
    std::vector<std::string> names;
    if (base_url.empty()) names.push_back("JIRA_BASE_URL");
    if (email.empty()) names.push_back("JIRA_EMAIL");
    if (api_token.empty()) names.push_back("JIRA_API_TOKEN");
    return names;
}

Config Config::from_env() {
    Config config;

    config.env_file = util::get_env_var("JIRA_ENV_FILE", config.env_file);
    size_t loaded = util::load_env_file(config.env_file);
    if (loaded > 0) {
        spdlog::info("Loaded {} environment variables from {}", loaded, config.env_file);
    } else {
        spdlog::debug("No .env file found, using environment variables");
    }

    config.credentials.base_url = util::trim(util::get_env_var("JIRA_BASE_URL"));
    while (util::ends_with(config.credentials.base_url, "/")) {
        config.credentials.base_url.pop_back();
    }
    config.credentials.email = util::trim(util::get_env_var("JIRA_EMAIL"));
    config.credentials.api_token = util::read_secret("JIRA_API_TOKEN_FILE", "JIRA_API_TOKEN");

    config.test_mode = util::get_env_var("JIRA_TEST_MODE") == "true";
    config.log_level = util::get_env_var("JIRA_LOG_LEVEL", config.log_level);

    return config;
}

void Config::validate() const {
    // Simulation never touches the network, so credentials are irrelevant
    if (test_mode) {
        spdlog::info("Running in test mode - skipping environment validation");
        return;
    }

    auto missing = credentials.missing();
    if (!missing.empty()) {
        throw MissingCredentialsError(missing);
    }
}
