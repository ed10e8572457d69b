#pragma once
#include "transport.hpp"
#include <optional>
#include <string>
#include <vector>

// Deterministic stand-in for the tracker. Answers are chosen from the shape
// of the request only (method and endpoint suffix); no I/O, no credentials.
class SimulationTransport : public Transport {
public:
    struct CannedResponse {
        std::optional<HttpMethod> method;  // nullopt matches any method
        std::string suffix;                // empty matches any endpoint
        long status;
        std::string body;
    };

    SimulationTransport();

    ApiResponse send(const ApiRequest& request) override;

    const std::vector<ApiRequest>& history() const { return history_; }

    static const std::vector<CannedResponse>& canned_responses();

private:
    std::vector<ApiRequest> history_;
};
