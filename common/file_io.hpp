#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file reads and stat helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
// Throws std::runtime_error if the file cannot be opened or mapped.
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    // nullptr for an empty file
    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Get file modification time as seconds since epoch; 0 if unknown
i64 get_mtime_s(const std::string& path);

// Unix permission bits (st_mode & 07777); 0644/0755 defaults elsewhere
u32 get_mode(const std::string& path);

// Lower-cased extension including the dot ("" if none)
std::string lower_extension(const std::string& path);

} // namespace file_io
