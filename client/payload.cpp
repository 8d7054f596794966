// ============================================================
// payload.cpp -- Payload validation
// ============================================================

#include "payload.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string ResolvedPayload::name() const {
    return fs::path(path).filename().string();
}

bool artifact_kind_from_path(const std::string& path, ArtifactKind& kind_out) {
    std::string ext = file_io::lower_extension(path);
    if (ext == ".dol") { kind_out = ArtifactKind::DOL; return true; }
    if (ext == ".elf") { kind_out = ArtifactKind::ELF; return true; }
    if (ext == ".zip") { kind_out = ArtifactKind::ZIP; return true; }
    return false;
}

ResolvedPayload resolve_payload(const std::string& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (path.empty() || ec || !fs::exists(st)) {
        throw NotFoundError(path + " doesn't seem to exist");
    }

    if (fs::is_directory(st)) {
        throw UnsupportedArtifact(path + " is a directory; only executables (.dol/.elf)"
                                  " and zip archives can be sent");
    }

    ResolvedPayload p;
    p.path = path;
    if (!fs::is_regular_file(st) || !artifact_kind_from_path(path, p.kind)) {
        throw UnsupportedArtifact(path + ": executable must be a .dol or .elf file"
                                  " (or a .zip archive)");
    }
    p.size = file_io::get_file_size(path);

    LOG_DEBUG("Payload " + p.path + " kind=" + artifact_kind_str(p.kind) +
              " size=" + std::to_string(p.size));
    return p;
}
