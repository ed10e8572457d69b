#include "types.hpp"
#include "json_schemas.hpp"

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

std::string ApiRequest::path() const {
    return "rest/api/" + std::to_string(static_cast<int>(version)) + "/" + endpoint;
}

Transition Transition::from_json(const nlohmann::json& j) {
    Transition t;
    t.id = json_field(j, ".id", "");
    t.name = json_field(j, ".name", "");
    t.to_status = json_field(j, ".to.name // .name", "");
    return t;
}
