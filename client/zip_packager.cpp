// ============================================================
// zip_packager.cpp -- Directory -> .zip archive
// ============================================================

#include "zip_packager.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

// ZIP record signatures
static constexpr u32 SIG_LOCAL_HEADER   = 0x04034b50u;
static constexpr u32 SIG_CENTRAL_HEADER = 0x02014b50u;
static constexpr u32 SIG_END_OF_CENTRAL = 0x06054b50u;

static constexpr u16 ZIP_VERSION_NEEDED = 20;               // 2.0: deflate, directories
static constexpr u16 ZIP_VERSION_MADE   = (3 << 8) | 20;    // host: unix
static constexpr u16 ZIP_FLAG_UTF8      = 0x0800;
static constexpr u16 ZIP_METHOD_STORE   = 0;
static constexpr u16 ZIP_METHOD_DEFLATE = 8;

static constexpr u64 ZIP32_MAX_SIZE    = 0xFFFFFFFFull;
static constexpr u64 ZIP32_MAX_ENTRIES = 0xFFFFu;

static constexpr u32 UNIX_S_IFDIR = 0040000;
static constexpr u32 UNIX_S_IFREG = 0100000;
static constexpr u32 DOS_ATTR_DIR = 0x10;

// ---- little-endian writers (ZIP is little-endian throughout) ----

static void put16(std::vector<u8>& b, u16 v) {
    b.push_back((u8)(v));
    b.push_back((u8)(v >> 8));
}

static void put32(std::vector<u8>& b, u32 v) {
    b.push_back((u8)(v));
    b.push_back((u8)(v >> 8));
    b.push_back((u8)(v >> 16));
    b.push_back((u8)(v >> 24));
}

static void put_bytes(std::vector<u8>& b, const std::string& s) {
    b.insert(b.end(), s.begin(), s.end());
}

void to_dos_datetime(i64 unix_seconds, u16& dos_time, u16& dos_date) {
    std::time_t t = (std::time_t)unix_seconds;
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    if (tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (u16)((0 << 9) | (1 << 5) | 1);   // 1980-01-01
        return;
    }
    dos_time = (u16)((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = (u16)(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

// Normalised absolute directory path without a trailing separator
static fs::path normalise_dir(const std::string& dir) {
    fs::path p = fs::absolute(fs::path(dir)).lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    return p;
}

ZipPackager::ZipPackager(int level) : level_(level) {}

std::string ZipPackager::archive_path_for(const std::string& dir) {
    fs::path p = normalise_dir(dir);
    std::string name = p.filename().string();
    if (name.empty()) {
        throw PackagingError("Cannot name an archive for directory '" + dir + "'");
    }
    return (p.parent_path() / (name + ".zip")).string();
}

namespace {

struct PendingMember {
    fs::path    abs;
    std::string rel;     // generic form, relative to the packaged dir
    bool        is_dir;
};

// Guards the output stream; removes the half-written archive unless
// commit() was reached.
class ArchiveFile {
public:
    explicit ArchiveFile(const std::string& path) : path_(path) {
        out_.open(path, std::ios::binary | std::ios::trunc);
        if (!out_) {
            throw PackagingError("Cannot create archive " + path);
        }
    }

    ~ArchiveFile() {
        if (!committed_) {
            out_.close();
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    void write(const void* data, size_t len) {
        if (offset_ + len > ZIP32_MAX_SIZE) {
            throw PackagingError("Archive " + path_ + " would exceed 4 GiB (ZIP64 not supported)");
        }
        out_.write(static_cast<const char*>(data), (std::streamsize)len);
        if (!out_) {
            throw PackagingError("Write to " + path_ + " failed");
        }
        offset_ += len;
    }

    void write(const std::vector<u8>& b) { write(b.data(), b.size()); }

    void commit() {
        out_.close();
        if (out_.fail()) {
            throw PackagingError("Closing " + path_ + " failed");
        }
        committed_ = true;
    }

    u32 offset() const { return (u32)offset_; }

private:
    std::string   path_;
    std::ofstream out_;
    u64           offset_{0};
    bool          committed_{false};
};

} // namespace

std::string member_name(const fs::path& prefix, const std::string& rel) {
    fs::path p = (prefix / fs::path(rel)).lexically_normal().relative_path();
    std::string name = p.generic_string();
    while (!name.empty() && name.back() == '/') name.pop_back();
    if (name == ".") name.clear();
    return name;
}

std::string ZipPackager::package(const std::string& dir) {
    fs::path root = normalise_dir(dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw PackagingError(dir + " is not a directory");
    }

    // Members are named after the path as typed ("apps/foo/boot.dol"),
    // normalised and without any root, so the receiver unpacks them
    // to the same place on the SD card.
    const fs::path prefix = fs::path(dir).lexically_normal();
    const std::string archive_path = archive_path_for(dir);
    LOG_INFO("Zipping " + root.string() + " -> " + archive_path);

    // Collect everything first so the archive order is stable
    std::vector<PendingMember> members;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec))
    {
        const fs::directory_entry& de = *it;
        fs::path rel = fs::relative(de.path(), root, ec);
        if (ec) break;
        std::error_code type_ec;
        if (de.is_directory(type_ec)) {
            members.push_back({de.path(), rel.generic_string(), true});
        } else if (de.is_regular_file(type_ec)) {
            members.push_back({de.path(), rel.generic_string(), false});
        } else {
            LOG_WARN("Skipping " + de.path().string() + ": not a regular file");
        }
    }
    if (ec) {
        throw PackagingError("Cannot walk " + root.string() + ": " + ec.message());
    }
    std::sort(members.begin(), members.end(),
              [](const PendingMember& a, const PendingMember& b) { return a.rel < b.rel; });

    if (members.size() > ZIP32_MAX_ENTRIES) {
        throw PackagingError(root.string() + " has " + std::to_string(members.size()) +
                             " entries; a ZIP archive without ZIP64 holds at most " +
                             std::to_string(ZIP32_MAX_ENTRIES));
    }

    entries_.clear();
    ArchiveFile out(archive_path);
    u64 raw_total = 0;

    for (const auto& m : members) {
        ZipEntry e;
        e.is_dir = m.is_dir;
        e.name   = member_name(prefix, m.rel);
        if (m.is_dir) e.name += "/";
        to_dos_datetime(file_io::get_mtime_s(m.abs.string()), e.dos_time, e.dos_date);
        e.mode = file_io::get_mode(m.abs.string());
        if (e.mode == 0) e.mode = m.is_dir ? 0755 : 0644;

        std::vector<u8> data;
        if (!m.is_dir) {
            std::unique_ptr<file_io::MmapReader> reader;
            try {
                reader = std::make_unique<file_io::MmapReader>(m.abs.string());
            } catch (const std::runtime_error& ex) {
                throw PackagingError(std::string("Cannot read ") + m.abs.string() + ": " + ex.what());
            }
            if (reader->size() > ZIP32_MAX_SIZE) {
                throw PackagingError(m.abs.string() + " is larger than 4 GiB (ZIP64 not supported)");
            }
            size_t len = (size_t)reader->size();
            e.uncompressed_size = (u32)len;
            e.crc32 = zlib_codec::crc32_of(reader->data(), len);
            try {
                data = zlib_codec::deflate_raw(reader->data(), len, level_);
            } catch (const CompressionError& ex) {
                throw PackagingError(std::string("Cannot deflate ") + m.abs.string() + ": " + ex.what());
            }
            if (data.size() >= len) {
                data.assign(reader->data(), reader->data() + len);
                e.method = ZIP_METHOD_STORE;
            } else {
                e.method = ZIP_METHOD_DEFLATE;
            }
            e.compressed_size = (u32)data.size();
            raw_total += len;
        }

        e.local_offset = out.offset();

        std::vector<u8> hdr;
        put32(hdr, SIG_LOCAL_HEADER);
        put16(hdr, ZIP_VERSION_NEEDED);
        put16(hdr, ZIP_FLAG_UTF8);
        put16(hdr, e.method);
        put16(hdr, e.dos_time);
        put16(hdr, e.dos_date);
        put32(hdr, e.crc32);
        put32(hdr, e.compressed_size);
        put32(hdr, e.uncompressed_size);
        put16(hdr, (u16)e.name.size());
        put16(hdr, 0);                       // extra field length
        put_bytes(hdr, e.name);
        out.write(hdr);
        if (!data.empty()) out.write(data);

        entries_.push_back(std::move(e));
    }

    // Central directory
    const u32 cd_offset = out.offset();
    std::vector<u8> cd;
    for (const auto& e : entries_) {
        u32 type_bits = e.is_dir ? UNIX_S_IFDIR : UNIX_S_IFREG;
        u32 ext_attr  = ((type_bits | e.mode) << 16) | (e.is_dir ? DOS_ATTR_DIR : 0);

        put32(cd, SIG_CENTRAL_HEADER);
        put16(cd, ZIP_VERSION_MADE);
        put16(cd, ZIP_VERSION_NEEDED);
        put16(cd, ZIP_FLAG_UTF8);
        put16(cd, e.method);
        put16(cd, e.dos_time);
        put16(cd, e.dos_date);
        put32(cd, e.crc32);
        put32(cd, e.compressed_size);
        put32(cd, e.uncompressed_size);
        put16(cd, (u16)e.name.size());
        put16(cd, 0);                        // extra field length
        put16(cd, 0);                        // comment length
        put16(cd, 0);                        // disk number start
        put16(cd, 0);                        // internal attributes
        put32(cd, ext_attr);
        put32(cd, e.local_offset);
        put_bytes(cd, e.name);
    }
    out.write(cd);

    std::vector<u8> eocd;
    put32(eocd, SIG_END_OF_CENTRAL);
    put16(eocd, 0);                          // this disk
    put16(eocd, 0);                          // disk with central directory
    put16(eocd, (u16)entries_.size());
    put16(eocd, (u16)entries_.size());
    put32(eocd, (u32)cd.size());
    put32(eocd, cd_offset);
    put16(eocd, 0);                          // comment length
    out.write(eocd);
    out.commit();

    LOG_INFO("Zipped " + std::to_string(entries_.size()) + " entries (" +
             utils::format_bytes(raw_total) + ") into " + archive_path);
    return archive_path;
}
