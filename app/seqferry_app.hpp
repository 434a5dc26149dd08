#pragma once

// ============================================================
// seqferry_app.hpp -- Top-level driver: manifest in, bucket
//   upload and sample descriptor out
// ============================================================

#include "../common/platform.hpp"
#include "../common/cancel.hpp"
#include "../transfer/orchestrator.hpp"
#include "../transfer/transfer_config.hpp"
#include "../transfer/uploader.hpp"
#include <string>

// Exit codes
static constexpr int EXIT_CODE_OK          = 0;
static constexpr int EXIT_CODE_USAGE       = 1;   // bad usage, missing manifest, descriptor failure
static constexpr int EXIT_CODE_FATAL       = 2;
static constexpr int EXIT_CODE_INTERRUPTED = 130;

struct AppOptions {
    std::string manifest_path;
    std::string directory;
    std::string bucket;
    std::string priorities{DEFAULT_PRIORITIES};
    size_t block_size{DEFAULT_BLOCK_SIZE};
    int    retries{DEFAULT_DOWNLOAD_ATTEMPTS};
    size_t workers{1};
    int    timeout_s{0};
    bool   no_verify{false};
    std::string digest;                  // empty = detect per entry
    std::string run_name;                // empty = upload-<UTC timestamp>
    std::string rewrite_rules_path;      // empty = built-in table
    bool   no_rewrite{false};
    std::string s3_gateway{DEFAULT_S3_GATEWAY};
    std::string uploader{DEFAULT_UPLOADER};
    int    connect_timeout_s{DEFAULT_CONNECT_TIMEOUT_S};
    int    stall_timeout_s{DEFAULT_STALL_TIMEOUT_S};
    bool   verbose{false};
};

class SeqferryApp {
public:
    explicit SeqferryApp(AppOptions opts);

    // Returns one of the EXIT_* codes
    int run();

    // Signal-safe; the in-flight entry stops at the next block
    void stop() { cancel_.cancel(); }
    bool stopping() const { return cancel_.cancelled(); }

    // Group the extracted archives, tally incomplete groups, write
    // <run_dir>/sample-<run>.txt and upload it to <bucket>/<run>/.
    // Returns the exit code for the run.
    int publish_descriptor(RunResult& result, const std::string& run_dir, Uploader& uploader);

    const std::string& run_name() const { return opts_.run_name; }

private:
    AppOptions  opts_;
    CancelToken cancel_;

    bool build_config(TransferConfig& cfg);
    void report(const RunResult& result, size_t entries) const;
};

// Routes SIGINT and SIGTERM to app.stop() while alive. On destruction,
// including unwinding, the app is forgotten and default handling restored.
class StopSignalScope {
public:
    explicit StopSignalScope(SeqferryApp& app);
    ~StopSignalScope();

    StopSignalScope(const StopSignalScope&) = delete;
    StopSignalScope& operator=(const StopSignalScope&) = delete;

    // App currently receiving stop signals, or nullptr
    static SeqferryApp* active();
};
