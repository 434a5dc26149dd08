// ============================================================
// archive_extractor.cpp -- tar / tar.zst extraction on microtar
// ============================================================

#include "archive_extractor.hpp"
#include "../common/compress.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>

extern "C" {
#include <microtar.h>
}

namespace archive {

static constexpr size_t COPY_CHUNK = 256 * 1024;
// GNU long names and pax records are read whole
static constexpr unsigned MAX_EXTENSION_SIZE = 1024 * 1024;
static constexpr const char* UNPACK_SUFFIX = ".unpacking";

bool is_archive(const std::string& name) {
    return utils::ends_with(name, ".tar") || utils::ends_with(name, ".tar.zst");
}

namespace {

// Removes its file on scope exit
struct ScratchFile {
    std::string path;
    ~ScratchFile() {
        if (path.empty()) return;
        std::error_code ec;
        fs::remove(path, ec);
    }
};

// Walks a tar file with microtar and writes members under root. Everything
// it creates is remembered so a failed pass can be undone.
class TarExtractor {
public:
    explicit TarExtractor(fs::path root) : root_(std::move(root)) {}
    ~TarExtractor() { close(); }

    TarExtractor(const TarExtractor&) = delete;
    TarExtractor& operator=(const TarExtractor&) = delete;

    void open(const std::string& tar_path);
    std::vector<MemberRecord> run();
    void close();

    // Remove files and directories created by run()
    void rollback();

private:
    void check(int err, const std::string& what);
    std::string read_text(const mtar_header_t& h);
    void parse_pax(const std::string& text);
    void write_member(const fs::path& dest, unsigned size);
    void make_dirs(const fs::path& dir);

    mtar_t tar_{};
    bool open_{false};
    bool empty_{false};
    fs::path root_;
    std::vector<char> buf_ = std::vector<char>(COPY_CHUNK);

    std::string next_name_;  // from GNU 'L' or pax path=

    std::vector<fs::path> created_files_;
    std::vector<fs::path> created_dirs_;
};

void TarExtractor::check(int err, const std::string& what) {
    if (err != MTAR_ESUCCESS) {
        throw std::runtime_error(what + ": " + mtar_strerror(err));
    }
}

void TarExtractor::open(const std::string& tar_path) {
    // microtar reads the first header on open; a leading null record is an
    // archive with no members
    int err = mtar_open(&tar_, tar_path.c_str(), "r");
    if (err == MTAR_ENULLRECORD) {
        empty_ = true;
        return;
    }
    check(err, "cannot open " + tar_path);
    open_ = true;
}

void TarExtractor::close() {
    if (!open_) return;
    open_ = false;
    if (mtar_close(&tar_) != MTAR_ESUCCESS) LOG_DEBUG("tar: close failed");
}

std::string TarExtractor::read_text(const mtar_header_t& h) {
    if (h.size > MAX_EXTENSION_SIZE) throw std::runtime_error("oversized tar extension header");
    if (h.size == 0) return std::string();
    std::string s(h.size, '\0');
    check(mtar_read_data(&tar_, &s[0], h.size), "reading tar extension header");
    return s;
}

// Records are "<len> <key>=<value>\n"; only path= matters here
void TarExtractor::parse_pax(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t sp = text.find(' ', pos);
        if (sp == std::string::npos) break;
        u64 rec_len = 0;
        if (!utils::parse_u64(text.substr(pos, sp - pos), rec_len) || rec_len == 0 ||
            pos + rec_len > text.size()) {
            throw std::runtime_error("malformed pax header");
        }
        std::string rec = text.substr(sp + 1, pos + rec_len - sp - 1);
        if (!rec.empty() && rec.back() == '\n') rec.pop_back();
        if (utils::starts_with(rec, "path=")) next_name_ = rec.substr(5);
        pos += rec_len;
    }
}

void TarExtractor::make_dirs(const fs::path& dir) {
    std::vector<fs::path> missing;
    for (fs::path p = dir; !p.empty() && p != root_ && !fs::exists(p); p = p.parent_path()) {
        missing.push_back(p);
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("cannot create " + dir.string() + ": " + ec.message());
    // Outermost first, so rollback can remove them innermost first
    created_dirs_.insert(created_dirs_.end(), missing.rbegin(), missing.rend());
}

void TarExtractor::write_member(const fs::path& dest, unsigned size) {
    make_dirs(dest.parent_path());

    // A file that was already there is not ours to remove on rollback
    if (!fs::exists(dest)) created_files_.push_back(dest);
    file_io::AppendWriter out;
    out.open(dest.string(), 0);

    unsigned left = size;
    while (left > 0) {
        unsigned n = (unsigned)std::min<size_t>(left, buf_.size());
        check(mtar_read_data(&tar_, buf_.data(), n), "reading " + dest.filename().string());
        out.append(buf_.data(), n);
        left -= n;
    }
    out.close();
}

std::vector<MemberRecord> TarExtractor::run() {
    std::vector<MemberRecord> members;
    if (empty_) return members;

    mtar_header_t h;
    for (;;) {
        int err = mtar_read_header(&tar_, &h);
        if (err == MTAR_ENULLRECORD) break;
        check(err, "reading tar header");

        char type = (char)h.type;

        // Extension headers describe the next member
        if (type == 'L') {
            next_name_ = read_text(h).c_str();
            check(mtar_next(&tar_), "skipping long name record");
            continue;
        }
        if (type == 'x') {
            parse_pax(read_text(h));
            check(mtar_next(&tar_), "skipping pax record");
            continue;
        }
        if (type == 'g') {
            check(mtar_next(&tar_), "skipping pax global record");
            continue;
        }

        std::string name = next_name_.empty() ? std::string(h.name) : next_name_;
        next_name_.clear();
        while (utils::starts_with(name, "./")) name = name.substr(2);

        if (type == MTAR_TDIR) {
            while (!name.empty() && name.back() == '/') name.pop_back();
            if (!name.empty()) {
                make_dirs(file_io::safe_join(root_, name));
                members.push_back({name, 0, true});
            }
        } else if (type == MTAR_TREG || type == '\0' || type == '7') {
            write_member(file_io::safe_join(root_, name), h.size);
            members.push_back({name, (u64)h.size, false});
        } else if (type == MTAR_TLNK || type == MTAR_TSYM) {
            LOG_WARN("tar: skipping link member " + name);
        } else {
            LOG_WARN(std::string("tar: skipping member ") + name + " of type '" + type + "'");
        }
        check(mtar_next(&tar_), "advancing past " + name);
    }
    return members;
}

void TarExtractor::rollback() {
    std::error_code ec;
    for (auto it = created_files_.rbegin(); it != created_files_.rend(); ++it) {
        fs::remove(*it, ec);
        if (ec) LOG_WARN("rollback: cannot remove " + it->string() + ": " + ec.message());
    }
    for (auto it = created_dirs_.rbegin(); it != created_dirs_.rend(); ++it) {
        // Only removes directories left empty
        fs::remove(*it, ec);
    }
    created_files_.clear();
    created_dirs_.clear();
}

// microtar seeks backwards, so a zstd stream is unpacked to a plain tar first
void unpack_zstd(const std::string& src, const std::string& dst) {
    file_io::FileReader file(src);
    compress::ZstdReader zin(file);
    file_io::AppendWriter out;
    out.open(dst, 0);
    std::vector<char> buf(COPY_CHUNK);
    for (;;) {
        size_t n = zin.read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(buf.data(), n);
    }
    out.close();
}

} // namespace

// ---- public API ----

ExtractResult extract(const std::string& archive_path) {
    ExtractResult res;
    fs::path path(archive_path);
    fs::path root = path.parent_path();
    if (root.empty()) root = ".";
    std::string name = path.filename().string();

    if (!is_archive(name)) {
        res.error = name + " is not a recognised archive";
        return res;
    }

    ScratchFile unpacked;
    std::string tar_path = archive_path;
    if (utils::ends_with(name, ".tar.zst")) {
        unpacked.path = archive_path + UNPACK_SUFFIX;
        try {
            unpack_zstd(archive_path, unpacked.path);
        } catch (const std::exception& e) {
            res.error = "decompressing " + name + ": " + e.what();
            return res;
        }
        tar_path = unpacked.path;
    }

    TarExtractor tar(root);
    try {
        tar.open(tar_path);
        res.members = tar.run();
    } catch (const std::exception& e) {
        tar.close();
        tar.rollback();
        res.members.clear();
        res.error = "extracting " + name + ": " + e.what();
        return res;
    }
    tar.close();

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) LOG_WARN("extracted " + name + " but could not delete it: " + ec.message());

    LOG_INFO("Extracted " + name + " (" + std::to_string(res.members.size()) + " members)");
    res.ok = true;
    return res;
}

ScanResult scan_and_extract(const std::string& dir) {
    ScanResult out;

    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) files.push_back(it->path());
    }
    if (ec) throw std::runtime_error("cannot scan " + dir + ": " + ec.message());
    std::sort(files.begin(), files.end());

    for (const auto& f : files) {
        std::string name = f.filename().string();
        if (!is_archive(name)) {
            LOG_INFO("Skipping non-archive file " + name);
            out.skipped.push_back(name);
            continue;
        }
        ExtractResult r = extract(f.string());
        if (r.ok) {
            out.groups.push_back({name, std::move(r.members)});
        } else {
            LOG_ERROR(r.error);
            out.failed.push_back({f.string(), r.error});
        }
    }
    return out;
}

} // namespace archive
