#pragma once

// ============================================================
// payload.hpp -- Payload validation
//
// Accepts .dol / .elf executables and .zip archives.  A directory
// is rejected here; turning it into an archive is the packager's
// job (see zip_packager.hpp).
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <string>

struct ResolvedPayload {
    std::string  path;
    ArtifactKind kind{ArtifactKind::DOL};
    u64          size{0};

    // Base name sent as the first element of the argument block
    std::string name() const;
};

// Throws NotFoundError if nothing is at path, UnsupportedArtifact for
// a directory or an unknown extension.
ResolvedPayload resolve_payload(const std::string& path);

// Map an extension (".dol", case-insensitive) to its kind.
// Returns false for anything else.
bool artifact_kind_from_path(const std::string& path, ArtifactKind& kind_out);
