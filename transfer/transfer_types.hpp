#pragma once

// ============================================================
// transfer_types.hpp -- Data model shared by the pipeline
// ============================================================

#include "../common/platform.hpp"
#include <array>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

// One row of the manifest
struct ManifestEntry {
    std::string id;
    std::string checksum;     // expected digest, hex (optionally "algo:hex")
    std::string size_hint;    // informational only
    std::string source_urls;  // comma-joined candidate URLs
    std::string sample_id;
};

// ---- Endpoint schemes ----
enum class Scheme {
    HTTP,
    HTTPS,
    S3,
    FTP,
    UNKNOWN,
};

const char* scheme_name(Scheme s);

// Scheme from the token before "://" (case-insensitive); UNKNOWN otherwise
Scheme scheme_of_url(const std::string& url);

// Scheme from a priority name such as "HTTP" or "s3"; UNKNOWN otherwise
Scheme scheme_from_name(const std::string& name);

// HTTPS ranks with HTTP; every other scheme is its own bucket
inline Scheme priority_bucket(Scheme s) {
    return s == Scheme::HTTPS ? Scheme::HTTP : s;
}

struct EndpointCandidate {
    Scheme      scheme;
    std::string url;
};

// Per-entry download progress; bytes_received <= total_size
struct TransferState {
    std::string target_path;
    std::string partial_path;
    u64 bytes_received{0};
    u64 total_size{0};
};

struct ProgressEvent {
    std::string label;        // entry id
    u64  bytes_received{0};
    u64  total_size{0};
    bool single_block{false}; // block size exceeds total size
    bool finished{false};
};

using ProgressFn = std::function<void(const ProgressEvent&)>;

// ---- Archive members and sample groups ----
struct MemberRecord {
    std::string name;   // path as declared inside the archive
    u64  size{0};
    bool is_dir{false};
};

struct ExtractedGroup {
    std::string archive;               // archive file name it came from
    std::vector<MemberRecord> members; // archive order
};

struct SampleRecord {
    std::string sample_id;
    std::string r1;
    std::string r2;
    std::string i1;
};

struct IncompleteGroupReport {
    std::string archive;
    std::vector<std::string> names;  // every member name in the group
    std::string reason;
};

// ---- Failures ----
enum class FailureKind : u8 {
    NO_VALID_ENDPOINT = 0,
    ENDPOINT_UNREACHABLE,
    CHECKSUM_MISMATCH,
    EXTRACTION_FAILED,
    UPLOAD_FAILED,
    INCOMPLETE_SAMPLE_GROUP,
};

static constexpr size_t FAILURE_KIND_COUNT = 6;

const char* failure_name(FailureKind k);

// Per-kind failure counters; safe for concurrent increment
class FailureTally {
public:
    FailureTally() {
        for (auto& c : counts_) c.store(0);
    }

    FailureTally(const FailureTally& o) {
        for (size_t i = 0; i < FAILURE_KIND_COUNT; ++i) counts_[i].store(o.counts_[i].load());
    }

    FailureTally& operator=(const FailureTally& o) {
        for (size_t i = 0; i < FAILURE_KIND_COUNT; ++i) counts_[i].store(o.counts_[i].load());
        return *this;
    }

    void add(FailureKind k, u32 n = 1) { counts_[(size_t)k].fetch_add(n); }
    u32 count(FailureKind k) const { return counts_[(size_t)k].load(); }

    u32 total() const {
        u32 t = 0;
        for (auto& c : counts_) t += c.load();
        return t;
    }

private:
    std::array<std::atomic<u32>, FAILURE_KIND_COUNT> counts_;
};

// ---- Per-entry state machine ----
enum class EntryState : u8 {
    PENDING,
    ENDPOINT_SELECTED,
    DOWNLOADED,
    VERIFIED,
    EXTRACTED,
    UPLOADED,
    DONE,
    FAILED,
    CANCELLED,
};

const char* state_name(EntryState s);

struct EntryReport {
    std::string id;
    EntryState  state{EntryState::PENDING};
    std::vector<FailureKind> failures;  // CHECKSUM_MISMATCH may sit beside DONE
    std::string endpoint_used;
    u64  bytes_downloaded{0};
    bool resumed_from_index{false};     // finished by an earlier run
    std::string message;                // last diagnostic

    bool has_failure(FailureKind k) const {
        for (auto f : failures) if (f == k) return true;
        return false;
    }
};
