// ============================================================
// file_io.cpp -- POSIX file streams and path helpers
// ============================================================

#include "file_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " +
                                 platform::errno_str(errno));
    }
#ifdef POSIX_FADV_SEQUENTIAL
    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read(void* buf, size_t len) {
    if (fd_ < 0) return 0;
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw std::runtime_error("read failed: " + path_ + ": " +
                                 platform::errno_str(errno));
    }
}

void FileReader::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ============================================================
// AppendWriter
// ============================================================

AppendWriter::~AppendWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void AppendWriter::open(const std::string& file_path, u64 truncate_to) {
    path_ = file_path;
    ensure_parent_dirs(file_path);

    fd_ = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " +
                                 platform::errno_str(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + file_path + ": " +
                                 platform::errno_str(err));
    }
    size_ = (u64)st.st_size;

    if (truncate_to < size_) {
        if (ftruncate(fd_, (off_t)truncate_to) != 0) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error("ftruncate failed: " + file_path + ": " +
                                     platform::errno_str(err));
        }
        size_ = truncate_to;
    }

    if (lseek(fd_, (off_t)size_, SEEK_SET) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("lseek failed: " + file_path + ": " +
                                 platform::errno_str(err));
    }
}

void AppendWriter::append(const void* data, size_t len) {
    if (fd_ < 0) throw std::runtime_error("AppendWriter::append on closed file");
    const char* p = static_cast<const char*>(data);
    size_t left = len;
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("write failed: " + path_ + ": " +
                                     platform::errno_str(errno));
        }
        p    += n;
        left -= (size_t)n;
    }
    size_ += len;
}

void AppendWriter::close() {
    if (fd_ < 0) return;
    int rc = fsync(fd_);
    int err = errno;
    ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        throw std::runtime_error("fsync failed: " + path_ + ": " +
                                 platform::errno_str(err));
    }
}

// ============================================================
// Utility functions
// ============================================================

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& relative_path) {
    if (relative_path.empty()) {
        throw std::runtime_error("Empty relative path");
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\') {
        throw std::runtime_error("Absolute path rejected: " + relative_path);
    }

    fs::path rel(relative_path);
    for (const auto& part : rel) {
        if (part == "..") {
            throw std::runtime_error("Path traversal rejected: " + relative_path);
        }
    }

    fs::path full = (root_dir / rel).lexically_normal();

    // Verify result is still under root_dir
    fs::path back = full.lexically_relative(root_dir.lexically_normal());
    if (back.empty() || *back.begin() == "..") {
        throw std::runtime_error("Path escapes root directory: " + relative_path);
    }

    return full;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

bool file_io::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

void file_io::move_file(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw std::runtime_error("rename " + from + " -> " + to + " failed: " + ec.message());
    }
}

size_t file_io::clear_directory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;
    std::vector<fs::path> victims;
    for (auto& de : fs::directory_iterator(dir, ec)) {
        victims.push_back(de.path());
    }
    if (ec) {
        throw std::runtime_error("Cannot list " + dir + ": " + ec.message());
    }
    for (auto& p : victims) {
        std::error_code rm_ec;
        fs::remove_all(p, rm_ec);
        if (rm_ec) {
            throw std::runtime_error("Cannot remove " + p.string() + ": " +
                                     rm_ec.message());
        }
    }
    return victims.size();
}
