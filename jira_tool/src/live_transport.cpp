#include "live_transport.hpp"
#include "errors.hpp"
#include "json_schemas.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

LiveTransport::LiveTransport(const Credentials& credentials)
    : credentials_(credentials) {}

std::string LiveTransport::url_for(const ApiRequest& request) const {
    return credentials_.base_url + "/" + request.path();
}

ApiResponse LiveTransport::send(const ApiRequest& request) {
    if (!credentials_.complete()) {
        throw MissingCredentialsError(credentials_.missing());
    }

    std::string url = url_for(request);
    spdlog::debug("{} {} (API v{})", to_string(request.method), url, static_cast<int>(request.version));

    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetAuth(cpr::Authentication{credentials_.email, credentials_.api_token, cpr::AuthMode::BASIC});
    session.SetHeader(cpr::Header{
        {"Accept", "application/json"},
        {"Content-Type", "application/json"}
    });
    session.SetTimeout(cpr::Timeout{REQUEST_TIMEOUT});

    if (!request.query.empty()) {
        cpr::Parameters parameters;
        for (const auto& [name, value] : request.query) {
            parameters.Add(cpr::Parameter{name, value});
        }
        session.SetParameters(parameters);
    }

    if (request.body) {
        std::string payload = serialize_body(*request.body);
        spdlog::debug("Request body: {}", payload);
        session.SetBody(cpr::Body{payload});
    }

    cpr::Response response;
    switch (request.method) {
        case HttpMethod::GET:
            response = session.Get();
            break;
        case HttpMethod::POST:
            response = session.Post();
            break;
        case HttpMethod::PUT:
            response = session.Put();
            break;
    }

    if (response.error) {
        spdlog::error("JIRA API request failed: {}", response.error.message);
        throw NetworkError(response.error.message);
    }

    spdlog::debug("HTTP {} from {}", response.status_code, url);
    return ApiResponse{response.status_code, response.text};
}
