// ============================================================
// loader_app.cpp -- hbload: validate, package, compress and
//   push one payload to the receiver
// ============================================================

#include "loader_app.hpp"
#include "chunk_planner.hpp"
#include "compressor.hpp"
#include "prompter.hpp"
#include "transfer_session.hpp"
#include "zip_packager.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

LoaderApp::LoaderApp(const LoaderOptions& opts,
                     Prompter& prompter,
                     DirectoryPackager& packager,
                     std::ostream& progress_out)
    : opts_(opts)
    , prompter_(prompter)
    , packager_(packager)
    , progress_out_(progress_out)
{}

ResolvedPayload LoaderApp::obtain_payload() {
    try {
        return resolve_payload(opts_.payload_path);
    } catch (const UnsupportedArtifact& e) {
        std::error_code ec;
        if (!fs::is_directory(opts_.payload_path, ec)) throw;

        LOG_WARN(e.what());
        if (!opts_.assume_yes) {
            if (!prompter_.interactive()) {
                throw PackagingError(opts_.payload_path +
                                     " is a directory; pass --yes to zip and send it");
            }
            if (!prompter_.confirm("Would you like to zip this directory and send it?")) {
                throw PackagingError("Directory " + opts_.payload_path + " not sent");
            }
        }
    }

    std::string archive = packager_.package(opts_.payload_path);
    return resolve_payload(archive);
}

TransferSummary LoaderApp::transfer() {
    // Endpoint first: a bad address must fail before anything is read,
    // written or connected.
    Endpoint endpoint = parse_endpoint(select_endpoint(opts_.endpoint, prompter_), opts_.port);

    ResolvedPayload payload = obtain_payload();
    LOG_INFO("Payload: " + payload.path + " (" + artifact_kind_str(payload.kind) + ", " +
             utils::format_bytes(payload.size) + ")");

    CompressedPayload compressed = compress_payload(payload);
    std::vector<u8> arg_block = proto::build_arg_block(payload.name(), opts_.launch_args);
    WireHeader header = proto::make_header(arg_block.size(),
                                           compressed.compressed_len(),
                                           compressed.original_len);
    ChunkSequence chunks(compressed.data);

    LOG_DEBUG("Header: version " + std::to_string(header.version_major) + "." +
              std::to_string(header.version_minor) +
              " args=" + std::to_string(header.arg_block_len) +
              " compressed=" + std::to_string(header.compressed_len) +
              " original=" + std::to_string(header.original_len));
    if (!opts_.launch_args.empty()) {
        LOG_INFO("Launch arguments: " + utils::format_args(opts_.launch_args));
    }

    TuiState tui_state;
    tui_state.bytes_total  = chunks.total_bytes();
    tui_state.chunks_total = chunks.count();
    tui_state.label        = payload.name();
    std::unique_ptr<Tui> tui;
    ChunkProgressCallback on_chunk;
    if (opts_.show_progress) {
        tui = std::make_unique<Tui>(tui_state, progress_out_, opts_.ansi_progress);
        on_chunk = [&](const ChunkView& chunk, u32 /*count*/, u64 sent, u64 /*total*/) {
            tui_state.chunks_sent = chunk.index + 1;
            tui_state.bytes_sent  = sent;
            tui->render();
        };
    }

    TransferSummary summary;
    summary.payload_name   = payload.name();
    summary.original_len   = compressed.original_len;
    summary.compressed_len = compressed.compressed_len();
    summary.chunk_count    = chunks.count();

    TransferSession session;
    session.open(endpoint);
    session.send(header, chunks, arg_block, on_chunk);
    summary.bytes_written = session.bytes_written();
    session.close();
    if (tui) tui->finish();

    LOG_INFO("Done. Sent " + summary.payload_name + ": " +
             utils::format_bytes(summary.original_len) + " as " +
             utils::format_bytes(summary.compressed_len) + " in " +
             std::to_string(summary.chunk_count) + " pieces");
    return summary;
}

int LoaderApp::run() {
    try {
        transfer();
        return exit_code_of(ExitCode::OK);
    } catch (const ConnectionError& e) {
        LOG_ERROR(e.what());
        LOG_ERROR("Make sure the target is on, connected to the network, and the "
                  "loader is running");
        return exit_code_of(e.code());
    } catch (const LoaderError& e) {
        LOG_ERROR(e.what());
        return exit_code_of(e.code());
    }
}
