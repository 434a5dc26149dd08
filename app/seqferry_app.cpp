// ============================================================
// seqferry_app.cpp -- Top-level driver
// ============================================================

#include "seqferry_app.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/progress_line.hpp"
#include "../common/utils.hpp"
#include "../transfer/curl_source.hpp"
#include "../transfer/manifest.hpp"
#include "../transfer/s3_source.hpp"
#include "../transfer/sample_grouper.hpp"
#include "../transfer/uploader.hpp"
#include <algorithm>
#include <csignal>
#include <memory>
#include <system_error>

SeqferryApp::SeqferryApp(AppOptions opts)
    : opts_(std::move(opts))
{
    if (opts_.run_name.empty()) {
        opts_.run_name = std::string(RUN_NAME_PREFIX) + utils::utc_timestamp();
    }
    cancel_.set_timeout(opts_.timeout_s);
}

bool SeqferryApp::build_config(TransferConfig& cfg) {
    for (auto& p : utils::split(opts_.priorities, ',')) {
        std::string name = utils::trim(p);
        if (!name.empty()) cfg.priorities.push_back(name);
    }

    if (!opts_.no_rewrite) {
        if (opts_.rewrite_rules_path.empty()) {
            cfg.rewrite_rules = default_rewrite_rules();
        } else {
            try {
                cfg.rewrite_rules = load_rewrite_rules(opts_.rewrite_rules_path);
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Cannot load rewrite rules: ") + e.what());
                return false;
            }
        }
    }

    if (!opts_.digest.empty()) {
        if (!hash::parse_algo(opts_.digest, cfg.digest_algo)) {
            LOG_ERROR("Unknown digest algorithm: " + opts_.digest);
            return false;
        }
        cfg.force_digest = true;
    }

    cfg.block_size        = opts_.block_size;
    cfg.download_attempts = opts_.retries;
    cfg.workers           = opts_.workers;
    cfg.verify_checksums  = !opts_.no_verify;
    cfg.bucket            = opts_.bucket;
    cfg.run_name          = opts_.run_name;
    return true;
}

int SeqferryApp::run() {
    // ---- manifest ----
    std::vector<ManifestEntry> entries;
    try {
        entries = parse_manifest(opts_.manifest_path);
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return EXIT_CODE_USAGE;
    }

    TransferConfig cfg;
    if (!build_config(cfg)) return EXIT_CODE_USAGE;

    // ---- run directory ----
    fs::path run_dir = fs::path(opts_.directory) / opts_.run_name;
    std::error_code ec;
    fs::create_directories(run_dir / STAGING_DIR_NAME, ec);
    if (ec) {
        LOG_ERROR("Cannot create " + (run_dir / STAGING_DIR_NAME).string() + ": " + ec.message());
        return EXIT_CODE_USAGE;
    }
    Logger::get().set_transfer_error_file((run_dir / FAILURE_LOG_NAME).string());
    LOG_INFO("Run directory: " + run_dir.string());

    // ---- retrieval backends ----
    CurlGlobal curl_global;
    CurlOptions copts;
    copts.connect_timeout_s = opts_.connect_timeout_s;
    copts.stall_timeout_s   = opts_.stall_timeout_s;
    copts.verbose           = opts_.verbose;

    auto http = std::make_shared<CurlSource>(copts, &cancel_);
    SourceRegistry sources;
    sources.add(Scheme::HTTP, http);
    sources.add(Scheme::HTTPS, http);
    sources.add(Scheme::FTP, http);
    sources.add(Scheme::S3, std::make_shared<S3Source>(http, opts_.s3_gateway));

    GsutilUploader uploader(opts_.uploader, &cancel_);

    ProgressLine progress_line;
    ProgressFn progress = [&progress_line](const ProgressEvent& ev) {
        if (ev.single_block) {
            progress_line.single_block(ev.label, ev.total_size);
        } else if (ev.finished) {
            progress_line.finish(ev.label, ev.bytes_received, ev.total_size);
        } else {
            progress_line.update(ev.label, ev.bytes_received, ev.total_size);
        }
    };

    // ---- transfer ----
    TransferOrchestrator orchestrator(cfg, sources, uploader, cancel_, progress);
    RunResult result = orchestrator.run(entries, run_dir.string());
    Logger::get().finish_progress();

    if (result.cancelled) {
        report(result, entries.size());
        LOG_WARN(std::string(cancel_.timed_out() ? "Run timed out" : "Interrupted") +
                 "; re-run with --run-name " + opts_.run_name + " to resume");
        return EXIT_CODE_INTERRUPTED;
    }

    return publish_descriptor(result, run_dir.string(), uploader);
}

int SeqferryApp::publish_descriptor(RunResult& result, const std::string& run_dir,
                                    Uploader& uploader)
{
    LOG_INFO("Creating sample descriptor.");
    grouper::GroupingResult grouping = grouper::group(result.groups);
    for (auto& inc : grouping.incomplete) {
        result.tally.add(FailureKind::INCOMPLETE_SAMPLE_GROUP);
        Logger::get().transfer_error(std::string(failure_name(FailureKind::INCOMPLETE_SAMPLE_GROUP)) +
                                     ": " + inc.archive + ": " + inc.reason + ": " +
                                     utils::join(inc.names, ", "));
    }

    std::string descriptor = (fs::path(run_dir) / ("sample-" + opts_.run_name + ".txt")).string();
    try {
        grouper::write_descriptor(grouping.records, descriptor);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error creating the sample descriptor: ") + e.what());
        report(result, result.reports.size());
        return EXIT_CODE_USAGE;
    }

    LOG_INFO("Uploading sample descriptor");
    std::string bucket = opts_.bucket;
    while (!bucket.empty() && bucket.back() == '/') bucket.pop_back();
    UploadResult up = uploader.put(descriptor, bucket + "/" + opts_.run_name + "/", false);
    if (!up.ok) {
        LOG_ERROR("Error uploading the sample descriptor: " + up.diagnostic);
        report(result, result.reports.size());
        return cancel_.cancelled() ? EXIT_CODE_INTERRUPTED : EXIT_CODE_USAGE;
    }

    report(result, result.reports.size());
    LOG_INFO("Process completed.");
    return EXIT_CODE_OK;
}

void SeqferryApp::report(const RunResult& result, size_t entries) const {
    LOG_INFO("==== Transfer report (" + opts_.run_name + ") ====");
    LOG_INFO("  entries:          " + std::to_string(entries));
    LOG_INFO("  done:             " + std::to_string(result.count(EntryState::DONE)) +
             " (" + std::to_string(std::count_if(result.reports.begin(), result.reports.end(),
                 [](const EntryReport& r) { return r.resumed_from_index; })) +
             " from an earlier run)");
    LOG_INFO("  failed:           " + std::to_string(result.count(EntryState::FAILED)));
    LOG_INFO("  cancelled:        " + std::to_string(result.count(EntryState::CANCELLED)));
    LOG_INFO("  downloaded:       " + utils::format_bytes(result.bytes_downloaded));
    for (size_t k = 0; k < FAILURE_KIND_COUNT; ++k) {
        u32 n = result.tally.count((FailureKind)k);
        if (n == 0) continue;
        std::string name = failure_name((FailureKind)k);
        if (name.size() < 24) name += std::string(24 - name.size(), ' ');
        LOG_INFO("  " + name + std::to_string(n));
    }
    for (auto& r : result.reports) {
        if (r.state == EntryState::FAILED || r.state == EntryState::CANCELLED ||
            !r.failures.empty()) {
            LOG_INFO("  " + r.id + ": " + state_name(r.state) +
                     (r.message.empty() ? "" : " (" + r.message + ")"));
        }
    }
}

// ---- stop signals ----

static SeqferryApp* g_stop_target = nullptr;

static void stop_signal_handler(int /*sig*/) {
    if (g_stop_target) g_stop_target->stop();
}

StopSignalScope::StopSignalScope(SeqferryApp& app) {
    g_stop_target = &app;
    std::signal(SIGINT,  stop_signal_handler);
    std::signal(SIGTERM, stop_signal_handler);
}

StopSignalScope::~StopSignalScope() {
    std::signal(SIGINT,  SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_stop_target = nullptr;
}

SeqferryApp* StopSignalScope::active() {
    return g_stop_target;
}
