#pragma once

// ============================================================
// manifest.hpp -- Tab-delimited manifest reader
// ============================================================

#include "transfer_types.hpp"
#include <string>
#include <vector>

// Columns: id, checksum, size, comma-joined URLs, sample id.
// The first line is a header and is skipped; blank lines are ignored;
// rows with fewer than five columns are skipped with a warning.
// Throws std::runtime_error if the file cannot be opened.
std::vector<ManifestEntry> parse_manifest(const std::string& path);

// Same, from text already in memory
std::vector<ManifestEntry> parse_manifest_text(const std::string& text);
