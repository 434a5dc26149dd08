// ============================================================
// manifest.cpp -- Tab-delimited manifest reader
// ============================================================

#include "manifest.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

std::vector<ManifestEntry> parse_manifest_text(const std::string& text) {
    std::vector<ManifestEntry> entries;
    std::unordered_set<std::string> seen;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line_no == 1) continue;  // header
        if (utils::trim(line).empty()) continue;

        auto cols = utils::split(line, '\t');
        if (cols.size() < 5) {
            LOG_WARN("manifest line " + std::to_string(line_no) + ": expected 5 columns, found " +
                     std::to_string(cols.size()) + ", skipping");
            continue;
        }

        ManifestEntry e;
        e.id          = utils::trim(cols[0]);
        e.checksum    = utils::trim(cols[1]);
        e.size_hint   = utils::trim(cols[2]);
        e.source_urls = utils::trim(cols[3]);
        e.sample_id   = utils::trim(cols[4]);

        if (e.id.empty()) {
            LOG_WARN("manifest line " + std::to_string(line_no) + ": empty id, skipping");
            continue;
        }
        // Two entries with one id would share staging paths
        if (!seen.insert(e.id).second) {
            LOG_WARN("manifest line " + std::to_string(line_no) + ": duplicate id " +
                     e.id + ", skipping");
            continue;
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

std::vector<ManifestEntry> parse_manifest(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Manifest file does not exist at " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_manifest_text(ss.str());
}
