#pragma once

// ============================================================
// archive_extractor.hpp -- In-place extraction of .tar and
//   .tar.zst archives into their containing directory
// ============================================================

#include "transfer_types.hpp"
#include <string>
#include <vector>

namespace archive {

// Archives are recognised by suffix only: ".tar" or ".tar.zst"
bool is_archive(const std::string& name);

struct ExtractResult {
    bool ok{false};
    std::vector<MemberRecord> members;  // archive order
    std::string error;
};

// Extract every member next to the archive, preserving relative paths.
// On success the archive is deleted. On failure everything written so far
// is removed again and the archive is left in place.
ExtractResult extract(const std::string& archive_path);

struct FailedArchive {
    std::string path;
    std::string error;
};

struct ScanResult {
    std::vector<ExtractedGroup> groups;   // one per extracted archive, name order
    std::vector<FailedArchive>  failed;
    std::vector<std::string>    skipped;  // regular files that are not archives
};

// Extract every archive found directly inside dir
ScanResult scan_and_extract(const std::string& dir);

} // namespace archive
