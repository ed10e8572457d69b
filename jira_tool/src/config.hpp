#pragma once
#include <string>
#include <vector>

struct Credentials {
    std::string base_url;
    std::string email;
    std::string api_token;

    bool complete() const;
    std::vector<std::string> missing() const;
};

struct Config {
    Credentials credentials;
    bool test_mode = false;
    std::string log_level = "info";
    std::string env_file = ".env";

    static Config from_env();
    void validate() const;
};
