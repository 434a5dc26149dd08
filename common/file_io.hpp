#pragma once

// ============================================================
// file_io.hpp -- POSIX file streams and path helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// Sequential byte source; read() returns 0 at end of stream, throws on error
class ByteReader {
public:
    virtual ~ByteReader() = default;
    virtual size_t read(void* buf, size_t len) = 0;
};

// ---- FileReader: buffered-by-caller sequential read of a local file ----
class FileReader : public ByteReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    size_t read(void* buf, size_t len) override;

    void close();

private:
    int fd_{-1};
    std::string path_;
};

// ---- AppendWriter: appends to a (possibly pre-existing) file ----
class AppendWriter {
public:
    AppendWriter() = default;
    ~AppendWriter();

    AppendWriter(const AppendWriter&) = delete;
    AppendWriter& operator=(const AppendWriter&) = delete;

    // Open/create path for appending. If truncate_to is smaller than the
    // current size, the file is cut back to truncate_to bytes first.
    void open(const std::string& path, u64 truncate_to = UINT64_MAX);

    // Append exactly len bytes; throws on error
    void append(const void* data, size_t len);

    // fsync and close; throws if the flush fails
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }

private:
    int fd_{-1};
    u64 size_{0};
    std::string path_;
};

// ---- Utility functions ----

// Join an archive/remote relative path onto root_dir.
// Throws if the path is empty, absolute, or has a ".." component.
fs::path safe_join(const fs::path& root_dir, const std::string& relative_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

bool exists(const std::string& path);

// Rename within one filesystem (no byte copy); throws on failure
void move_file(const std::string& from, const std::string& to);

// Remove every entry inside dir, keeping dir itself; returns entries removed
size_t clear_directory(const std::string& dir);

} // namespace file_io
