#pragma once

// ============================================================
// zip_packager.hpp -- Turn an application directory into a
//                     .zip the receiver can unpack
//
// "apps/foo/" becomes "apps/foo.zip" containing apps/foo/boot.dol,
// apps/foo/meta.xml, ...  Members keep the path as it was given,
// minus any root.  Entries are deflated (or stored when deflate
// does not help) and written in sorted order, so the same tree
// always yields the same archive.  No ZIP64.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <filesystem>
#include <string>
#include <vector>

class DirectoryPackager {
public:
    virtual ~DirectoryPackager() = default;

    // Package dir and return the path of the archive written.
    // Throws PackagingError.
    virtual std::string package(const std::string& dir) = 0;
};

// One member of the archive, as recorded in the central directory
struct ZipEntry {
    std::string name;         // '/'-separated, directories end in '/'
    bool        is_dir{false};
    u16         method{0};    // 0 = stored, 8 = deflated
    u16         dos_time{0};
    u16         dos_date{0};
    u32         crc32{0};
    u32         compressed_size{0};
    u32         uncompressed_size{0};
    u32         mode{0};      // unix permission bits
    u32         local_offset{0};
};

class ZipPackager : public DirectoryPackager {
public:
    explicit ZipPackager(int level = DEFLATE_LEVEL);

    std::string package(const std::string& dir) override;

    // Where package(dir) will write: the directory's sibling "<name>.zip"
    static std::string archive_path_for(const std::string& dir);

    // Entries of the last archive written
    const std::vector<ZipEntry>& entries() const { return entries_; }

private:
    int level_;
    std::vector<ZipEntry> entries_;
};

// Archive name for rel (a path inside the packaged directory) when
// the directory was given as prefix: normalised, '/'-separated, root
// and trailing '/' removed.
std::string member_name(const std::filesystem::path& prefix, const std::string& rel);

// MS-DOS date/time fields for a unix timestamp (local time, clamped
// to 1980-01-01)
void to_dos_datetime(i64 unix_seconds, u16& dos_time, u16& dos_date);
