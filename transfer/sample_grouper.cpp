// ============================================================
// sample_grouper.cpp -- R1/R2/I1 sample triples
// ============================================================

#include "sample_grouper.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cerrno>
#include <cstdio>
#include <stdexcept>

namespace grouper {

Role classify(const std::string& name) {
    if (!utils::ends_with(name, DATA_SUFFIX)) return Role::NONE;
    if (name.find("_R1_") != std::string::npos) return Role::R1;
    if (name.find("_R2_") != std::string::npos) return Role::R2;
    if (name.find("_I1_") != std::string::npos) return Role::I1;
    return Role::NONE;
}

GroupingResult group(const std::vector<ExtractedGroup>& groups) {
    GroupingResult out;

    for (const auto& g : groups) {
        std::vector<std::string> r1, r2, i1, names;

        for (const auto& m : g.members) {
            if (m.is_dir) continue;
            names.push_back(m.name);
            switch (classify(m.name)) {
            case Role::R1: r1.push_back(m.name); break;
            case Role::R2: r2.push_back(m.name); break;
            case Role::I1: i1.push_back(m.name); break;
            case Role::NONE:
                LOG_INFO("Skipping file " + m.name);
                out.skipped.push_back(m.name);
                break;
            }
        }

        if (r1.size() == 1 && r2.size() == 1 && i1.size() == 1) {
            SampleRecord rec;
            rec.sample_id = r1[0].substr(0, r1[0].find("_R1_"));
            rec.r1 = r1[0];
            rec.r2 = r2[0];
            rec.i1 = i1[0];
            out.records.push_back(std::move(rec));
            continue;
        }

        IncompleteGroupReport rep;
        rep.archive = g.archive;
        rep.names   = std::move(names);
        rep.reason  = "expected 1 each of R1, R2 and I1, found " +
                      std::to_string(r1.size()) + "/" + std::to_string(r2.size()) +
                      "/" + std::to_string(i1.size());
        LOG_WARN("Group from " + g.archive + " did not contain 1 each of R1, R2 and I1 files (" +
                 rep.reason + "): " + utils::join(rep.names, ", "));
        out.incomplete.push_back(std::move(rep));
    }

    return out;
}

void write_descriptor(const std::vector<SampleRecord>& records, const std::string& path) {
    LOG_INFO("Processing " + std::to_string(records.size()) + " " +
             (records.size() == 1 ? "set" : "sets") + " of files.");

    file_io::ensure_parent_dirs(path);
    FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        throw std::runtime_error("cannot create " + path + ": " + platform::errno_str(errno));
    }

    bool ok = true;
    for (const auto& r : records) {
        std::string line = r.sample_id + "\t" + r.r1 + "\t" + r.r2 + "\t" + r.i1 + "\n";
        if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
            ok = false;
            break;
        }
    }
    int err = errno;
    if (std::fclose(f) != 0) {
        ok = false;
        err = errno;
    }
    if (!ok) {
        throw std::runtime_error("writing " + path + " failed: " + platform::errno_str(err));
    }
}

} // namespace grouper
