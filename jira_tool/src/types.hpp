#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class HttpMethod {
    GET,
    POST,
    PUT
};

// The tracker serves two REST versions side by side
enum class ApiVersion {
    V2 = 2,
    V3 = 3
};

std::string to_string(HttpMethod method);

struct ApiRequest {
    HttpMethod method = HttpMethod::GET;
    std::string endpoint;  // relative to /rest/api/<version>/, no leading slash
    std::map<std::string, std::string> query;
    std::optional<nlohmann::json> body;
    ApiVersion version = ApiVersion::V3;

    std::string path() const;
};

struct ApiResponse {
    long status = 0;
    std::string body;
};

struct Transition {
    std::string id;
    std::string name;
    std::string to_status;

    static Transition from_json(const nlohmann::json& j);
};
