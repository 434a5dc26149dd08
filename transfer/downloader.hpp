#pragma once

// ============================================================
// downloader.hpp -- Resumable block-wise download with
//   multi-endpoint fallback
// ============================================================

#include "transfer_types.hpp"
#include "endpoint_source.hpp"
#include "../common/cancel.hpp"
#include <string>
#include <vector>

struct DownloadResult {
    bool ok{false};
    bool skipped{false};     // target already existed; no endpoint was contacted
    bool cancelled{false};   // stopped mid-transfer; partial file retained
    FailureKind failure{FailureKind::ENDPOINT_UNREACHABLE}; // meaningful when !ok && !cancelled
    u64  bytes_written{0};   // bytes appended by this call
    u64  resumed_from{0};    // offset the transfer started at
    std::string endpoint_used;
    TransferState state;
    std::string message;
};

class Downloader {
public:
    explicit Downloader(const SourceRegistry& sources, const CancelToken* cancel = nullptr)
        : sources_(sources), cancel_(cancel) {}

    // Fetch the first reachable candidate into partial_path, then rename it
    // to target_path. An existing target short-circuits without contacting
    // any endpoint. An existing partial file is resumed from its size when
    // the endpoint supports ranges. A broken connection is not retried here;
    // the partial file is kept so the next call resumes it.
    DownloadResult download(const std::vector<EndpointCandidate>& candidates,
                            const std::string& target_path,
                            const std::string& partial_path,
                            size_t block_size,
                            const ProgressFn& progress = nullptr,
                            const std::string& label = "");

private:
    const SourceRegistry& sources_;
    const CancelToken*    cancel_;

    bool cancelled() const { return cancel_ && cancel_->cancelled(); }
};
