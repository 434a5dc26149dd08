#pragma once

// ============================================================
// completion_index.hpp -- Persistent record of finished entries
// ============================================================

#include "transfer_types.hpp"
#include <cstdio>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Entries that reached DONE, with the archive groups they produced, so a
// re-run under the same run directory skips them and still describes
// their samples. Stored as text, one line per group:
//   "<entry-id>\t<archive>\t<member>\t<member>..."
// An entry that produced no group is a line holding just its id.

class CompletionIndex {
public:
    explicit CompletionIndex(const std::string& path) : path_(path) {
        load();
    }

    bool has_entry(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex_);
        return index_.count(id) > 0;
    }

    std::vector<ExtractedGroup> groups(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = index_.find(id);
        return it != index_.end() ? it->second : std::vector<ExtractedGroup>{};
    }

    // Record a finished entry and persist immediately; throws on write failure
    void mark_done(const std::string& id, const std::vector<ExtractedGroup>& groups) {
        std::lock_guard<std::mutex> lk(mutex_);
        index_[id] = groups;
        save_locked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return index_.size();
    }

    const std::string& path() const { return path_; }

private:
    void load() {
        std::ifstream f(path_);
        if (!f) return;
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            std::vector<std::string> cols;
            size_t start = 0;
            for (;;) {
                size_t tab = line.find('\t', start);
                cols.push_back(line.substr(start, tab - start));
                if (tab == std::string::npos) break;
                start = tab + 1;
            }
            auto& groups = index_[cols[0]];
            if (cols.size() < 2) continue;
            ExtractedGroup g;
            g.archive = cols[1];
            for (size_t i = 2; i < cols.size(); ++i) {
                g.members.push_back({cols[i], 0, false});
            }
            groups.push_back(std::move(g));
        }
    }

    void save_locked() {
        std::string tmp = path_ + ".tmp";
        {
            std::ofstream f(tmp, std::ios::trunc);
            if (!f) throw std::runtime_error("cannot write " + tmp);
            f << "# seqferry completion index\n";
            for (auto& [id, groups] : index_) {
                if (groups.empty()) {
                    f << id << "\n";
                    continue;
                }
                for (auto& g : groups) {
                    f << id << "\t" << g.archive;
                    for (auto& m : g.members) {
                        if (!m.is_dir) f << "\t" << m.name;
                    }
                    f << "\n";
                }
            }
            f.flush();
            if (!f) throw std::runtime_error("write to " + tmp + " failed");
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            throw std::runtime_error("cannot replace " + path_);
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<ExtractedGroup>> index_;
    std::string path_;
};
