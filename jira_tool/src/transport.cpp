#include "transport.hpp"
#include "live_transport.hpp"
#include "simulation_transport.hpp"

std::unique_ptr<Transport> make_transport(const Config& config) {
    if (config.test_mode) {
        return std::make_unique<SimulationTransport>();
    }
    return std::make_unique<LiveTransport>(config.credentials);
}
