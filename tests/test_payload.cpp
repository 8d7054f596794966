// ============================================================
// test_payload.cpp -- Payload validation
// ============================================================

#include "client/payload.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using testing_util::TempDir;
using testing_util::write_file;

TEST(ResolvePayload, AcceptsSupportedKinds) {
    TempDir tmp;
    write_file(tmp.path() / "boot.dol", std::string("dol bytes"));
    write_file(tmp.path() / "boot.elf", std::string("elf"));
    write_file(tmp.path() / "app.zip",  std::string("PK"));

    ResolvedPayload dol = resolve_payload(tmp.str("boot.dol"));
    EXPECT_EQ(ArtifactKind::DOL, dol.kind);
    EXPECT_EQ(9u, dol.size);
    EXPECT_EQ("boot.dol", dol.name());

    EXPECT_EQ(ArtifactKind::ELF, resolve_payload(tmp.str("boot.elf")).kind);
    EXPECT_EQ(ArtifactKind::ZIP, resolve_payload(tmp.str("app.zip")).kind);
}

TEST(ResolvePayload, ExtensionMatchIsCaseInsensitive) {
    TempDir tmp;
    write_file(tmp.path() / "BOOT.DOL", std::string("x"));
    EXPECT_EQ(ArtifactKind::DOL, resolve_payload(tmp.str("BOOT.DOL")).kind);
}

TEST(ResolvePayload, MissingPathIsNotFound) {
    TempDir tmp;
    EXPECT_THROW(resolve_payload(tmp.str("nope.dol")), NotFoundError);
    EXPECT_THROW(resolve_payload(""), NotFoundError);
}

TEST(ResolvePayload, DirectoryIsUnsupportedArtifact) {
    TempDir tmp;
    fs::create_directories(tmp.path() / "myapp");
    write_file(tmp.path() / "myapp" / "boot.dol", std::string("x"));
    EXPECT_THROW(resolve_payload(tmp.str("myapp")), UnsupportedArtifact);
}

TEST(ResolvePayload, UnknownExtensionIsUnsupportedArtifact) {
    TempDir tmp;
    write_file(tmp.path() / "readme.txt", std::string("hello"));
    write_file(tmp.path() / "noext", std::string("hello"));
    write_file(tmp.path() / "boot.dol.bak", std::string("hello"));
    EXPECT_THROW(resolve_payload(tmp.str("readme.txt")), UnsupportedArtifact);
    EXPECT_THROW(resolve_payload(tmp.str("noext")), UnsupportedArtifact);
    EXPECT_THROW(resolve_payload(tmp.str("boot.dol.bak")), UnsupportedArtifact);
}

TEST(ArtifactKindFromPath, MapsExtensions) {
    ArtifactKind k;
    EXPECT_TRUE(artifact_kind_from_path("a/b/c.Elf", k));
    EXPECT_EQ(ArtifactKind::ELF, k);
    EXPECT_FALSE(artifact_kind_from_path("a/b/c.tar", k));
    EXPECT_FALSE(artifact_kind_from_path("dol", k));
}
