#pragma once

// ============================================================
// endpoint.hpp -- Receiver address resolution
//
// "tcp:192.168.1.106" -> { host = "192.168.1.106", port = 4299 }
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <string>

class Prompter;

struct Endpoint {
    std::string raw;    // as configured, prefix included
    std::string host;
    u16         port{0};

    std::string str() const { return host + ":" + std::to_string(port); }
};

// Strip the transport prefix and pair the host with the receiver's
// port (the well-known one unless told otherwise).  Throws
// ConfigurationError when the prefix or the host is missing, or the
// port is 0.  No socket is touched.
Endpoint parse_endpoint(const std::string& raw, u16 port = RECEIVER_PORT);

// Where the endpoint string may come from, highest priority first
struct EndpointSources {
    std::string cli_value;   // --endpoint
    std::string env_value;   // $WIILOAD
    bool        env_set{false};  // $WIILOAD present, even if empty
};

// Pick the endpoint string: --endpoint, then $WIILOAD, then ask the
// user for an address (prefix added).  Only an unset $WIILOAD leads
// to the question; an empty one is returned for parse_endpoint to
// reject.  Throws ConfigurationError if
// none is available.
std::string select_endpoint(const EndpointSources& sources, Prompter& prompter);
