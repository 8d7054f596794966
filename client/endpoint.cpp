// ============================================================
// endpoint.cpp -- Receiver address resolution
// ============================================================

#include "endpoint.hpp"
#include "prompter.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include <cstring>

Endpoint parse_endpoint(const std::string& raw, u16 port) {
    const size_t prefix_len = std::strlen(ENDPOINT_PREFIX);
    if (raw.compare(0, prefix_len, ENDPOINT_PREFIX) != 0) {
        throw ConfigurationError("Endpoint '" + raw + "' doesn't start with '" +
                                 ENDPOINT_PREFIX + "'");
    }
    std::string host = raw.substr(prefix_len);
    if (host.empty()) {
        throw ConfigurationError("Endpoint '" + raw + "' has no address after '" +
                                 ENDPOINT_PREFIX + "'");
    }

    if (port == 0) {
        throw ConfigurationError("Invalid receiver port 0");
    }

    Endpoint ep;
    ep.raw  = raw;
    ep.host = host;
    ep.port = port;
    return ep;
}

std::string select_endpoint(const EndpointSources& sources, Prompter& prompter) {
    if (!sources.cli_value.empty()) {
        LOG_DEBUG("Endpoint from --endpoint: " + sources.cli_value);
        return sources.cli_value;
    }
    if (sources.env_set) {
        LOG_DEBUG("Endpoint from $WIILOAD: " + sources.env_value);
        return sources.env_value;
    }

    if (!prompter.interactive()) {
        throw ConfigurationError("$WIILOAD not set; set it to tcp:<address> or pass --endpoint");
    }
    if (!prompter.confirm("$WIILOAD not set. Would you like to set it temporarily?")) {
        throw ConfigurationError("No receiver address given");
    }
    std::string host = prompter.ask("Please enter the receiver's IP address (i.e. 192.168.1.106): ");
    if (host.empty()) {
        throw ConfigurationError("No receiver address given");
    }
    return std::string(ENDPOINT_PREFIX) + host;
}
