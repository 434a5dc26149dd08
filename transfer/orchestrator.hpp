#pragma once

// ============================================================
// orchestrator.hpp -- Drives manifest entries through
//   select -> download -> verify -> extract -> upload
// ============================================================

#include "transfer_types.hpp"
#include "transfer_config.hpp"
#include "endpoint_source.hpp"
#include "uploader.hpp"
#include "completion_index.hpp"
#include "../common/cancel.hpp"
#include <string>
#include <vector>

struct RunResult {
    std::vector<ExtractedGroup> groups;   // manifest order
    FailureTally tally;
    std::vector<EntryReport> reports;     // manifest order
    u64  bytes_downloaded{0};
    bool cancelled{false};

    size_t count(EntryState s) const {
        size_t n = 0;
        for (auto& r : reports) if (r.state == s) ++n;
        return n;
    }
};

// Staging and quarantine directory name for an entry id
std::string entry_dir_name(const std::string& id);

class TransferOrchestrator {
public:
    TransferOrchestrator(TransferConfig config,
                         const SourceRegistry& sources,
                         Uploader& uploader,
                         const CancelToken& cancel,
                         ProgressFn progress = nullptr);

    // Process every entry under run_dir (staging in run_dir/fastqs/<id>/).
    // Per-entry failures are tallied and never stop the run; cancellation
    // stops scheduling further entries.
    RunResult run(const std::vector<ManifestEntry>& entries, const std::string& run_dir);

private:
    // Advances rep.state stage by stage; rep.state names the stage that
    // was running if this throws
    void process_entry(const ManifestEntry& entry,
                       const std::string& run_dir,
                       CompletionIndex& index,
                       FailureTally& tally,
                       std::vector<ExtractedGroup>& groups_out,
                       EntryReport& rep);

    void fail(EntryReport& rep, FailureKind kind, const std::string& msg, FailureTally& tally);
    void cancelled(EntryReport& rep, const std::string& where);

    bool verify_entry(const ManifestEntry& entry, const std::string& path, std::string& why) const;
    void quarantine(const std::string& archive, const std::string& run_dir, const std::string& id);
    void clear_staging(const std::string& staging);
    std::string upload_dest() const;

    TransferConfig        config_;
    const SourceRegistry& sources_;
    Uploader&             uploader_;
    const CancelToken&    cancel_;
    ProgressFn            progress_;
};
