#pragma once

// ============================================================
// loader_app.hpp -- hbload: validate, package, compress and
//   push one payload to the receiver
// ============================================================

#include "../common/platform.hpp"
#include "endpoint.hpp"
#include "payload.hpp"
#include <ostream>
#include <string>
#include <vector>

class Prompter;
class DirectoryPackager;

struct LoaderOptions {
    std::string              payload_path;
    std::vector<std::string> launch_args;    // forwarded after the payload name
    EndpointSources          endpoint;
    u16                      port{RECEIVER_PORT};
    bool                     assume_yes{false};    // package directories without asking
    bool                     show_progress{true};
    bool                     ansi_progress{false}; // redraw the bar in place
};

struct TransferSummary {
    std::string payload_name;
    u64         original_len{0};
    u64         compressed_len{0};
    u32         chunk_count{0};
    u64         bytes_written{0};
};

class LoaderApp {
public:
    LoaderApp(const LoaderOptions& opts,
              Prompter& prompter,
              DirectoryPackager& packager,
              std::ostream& progress_out);

    // Run the whole transfer.  Returns 0 on success, otherwise the
    // exit code of the error that ended it (already logged).
    int run();

    // Same pipeline; throws LoaderError instead of returning a code.
    TransferSummary transfer();

private:
    LoaderOptions      opts_;
    Prompter&          prompter_;
    DirectoryPackager& packager_;
    std::ostream&      progress_out_;

    // Resolve the payload, packaging a directory if allowed to
    ResolvedPayload obtain_payload();
};
