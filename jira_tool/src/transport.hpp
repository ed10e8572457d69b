#pragma once
#include "config.hpp"
#include "types.hpp"
#include <memory>

// One request/response exchange with the tracker. Implementations return
// whatever status the server produced; status interpretation belongs to
// JiraClient so that every implementation is judged by the same rules.
class Transport {
public:
    Transport() = default;
    virtual ~Transport() = default;
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;
    Transport(Transport&&) = delete;
    Transport& operator=(Transport&&) = delete;

    // Throws NetworkError or MissingCredentialsError
    virtual ApiResponse send(const ApiRequest& request) = 0;
};

// Picks the simulation transport when config.test_mode is set
std::unique_ptr<Transport> make_transport(const Config& config);
