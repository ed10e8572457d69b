#pragma once
#include "config.hpp"
#include "transport.hpp"
#include <chrono>

class LiveTransport : public Transport {
public:
    static constexpr std::chrono::seconds REQUEST_TIMEOUT{30};

    explicit LiveTransport(const Credentials& credentials);

    ApiResponse send(const ApiRequest& request) override;

    std::string url_for(const ApiRequest& request) const;

private:
    const Credentials& credentials_;
};
