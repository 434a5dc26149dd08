// ============================================================
// orchestrator.cpp -- Per-entry state machine and worker pool
// ============================================================

#include "orchestrator.hpp"
#include "archive_extractor.hpp"
#include "checksum.hpp"
#include "downloader.hpp"
#include "endpoint_selector.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <system_error>

// Failure kind charged when an unexpected error escapes a stage
static FailureKind stage_failure(EntryState s) {
    switch (s) {
    case EntryState::PENDING:
    case EntryState::ENDPOINT_SELECTED: return FailureKind::ENDPOINT_UNREACHABLE;
    case EntryState::DOWNLOADED:
    case EntryState::VERIFIED:          return FailureKind::EXTRACTION_FAILED;
    default:                            return FailureKind::UPLOAD_FAILED;
    }
}

// Directory name for an entry id. Ids that sanitising would change get a
// hash of the raw id appended, so distinct ids never share a directory.
std::string entry_dir_name(const std::string& id) {
    std::string safe = utils::safe_component(id);
    if (safe == id) return safe;
    return safe + "-" + hash::xxh3_64_hex(id.data(), id.size());
}

TransferOrchestrator::TransferOrchestrator(TransferConfig config,
                                           const SourceRegistry& sources,
                                           Uploader& uploader,
                                           const CancelToken& cancel,
                                           ProgressFn progress)
    : config_(std::move(config))
    , sources_(sources)
    , uploader_(uploader)
    , cancel_(cancel)
    , progress_(std::move(progress))
{}

RunResult TransferOrchestrator::run(const std::vector<ManifestEntry>& entries,
                                    const std::string& run_dir)
{
    RunResult result;
    result.reports.resize(entries.size());
    std::vector<std::vector<ExtractedGroup>> groups(entries.size());

    CompletionIndex index((fs::path(run_dir) / TRANSFER_INDEX_NAME).string());
    if (index.size() > 0) {
        LOG_INFO("Completion index lists " + std::to_string(index.size()) +
                 " finished entries from an earlier run");
    }

    size_t workers = std::max<size_t>(1, config_.workers);
    LOG_INFO("Processing " + std::to_string(entries.size()) + " manifest entries with " +
             std::to_string(workers) + (workers == 1 ? " worker" : " workers"));

    ThreadPool::run_indexed(workers, entries.size(), [&](size_t i) {
        EntryReport& rep = result.reports[i];
        rep.id = entries[i].id;
        if (cancel_.cancelled()) {
            rep.state = EntryState::CANCELLED;
            rep.message = "not started";
            return;
        }
        try {
            process_entry(entries[i], run_dir, index, result.tally, groups[i], rep);
        } catch (const std::exception& e) {
            groups[i].clear();
            fail(rep, stage_failure(rep.state), std::string("unexpected error: ") + e.what(),
                 result.tally);
        }
    });

    for (size_t i = 0; i < entries.size(); ++i) {
        for (auto& g : groups[i]) result.groups.push_back(std::move(g));
        result.bytes_downloaded += result.reports[i].bytes_downloaded;
        if (result.reports[i].state == EntryState::CANCELLED) result.cancelled = true;
    }
    return result;
}

void TransferOrchestrator::process_entry(const ManifestEntry& entry,
                                         const std::string& run_dir,
                                         CompletionIndex& index,
                                         FailureTally& tally,
                                         std::vector<ExtractedGroup>& groups_out,
                                         EntryReport& rep)
{

    if (index.has_entry(entry.id)) {
        LOG_INFO(entry.id + ": finished by an earlier run, skipping");
        groups_out = index.groups(entry.id);
        rep.state = EntryState::DONE;
        rep.resumed_from_index = true;
        return;
    }

    // ---- PENDING -> ENDPOINT_SELECTED ----
    auto candidates = select_endpoints(entry.source_urls, config_.priorities,
                                       config_.rewrite_rules);
    if (candidates.empty()) {
        fail(rep, FailureKind::NO_VALID_ENDPOINT,
             "No valid URL found in the manifest for file ID " + entry.id, tally);
        return;
    }
    rep.state = EntryState::ENDPOINT_SELECTED;

    fs::path staging = fs::path(run_dir) / STAGING_DIR_NAME / entry_dir_name(entry.id);
    std::string file_name = utils::safe_component(utils::url_basename(candidates[0].url));
    std::string target  = (staging / file_name).string();
    std::string partial = target + PARTIAL_SUFFIX;

    std::error_code ec;
    fs::create_directories(staging, ec);
    if (ec) {
        fail(rep, FailureKind::ENDPOINT_UNREACHABLE,
             "cannot create " + staging.string() + ": " + ec.message(), tally);
        return;
    }

    // ---- ENDPOINT_SELECTED -> DOWNLOADED ----
    Downloader downloader(sources_, &cancel_);
    int attempts = std::max(1, config_.download_attempts);
    DownloadResult dl;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        dl = downloader.download(candidates, target, partial, config_.block_size,
                                 progress_, entry.id);
        rep.bytes_downloaded += dl.bytes_written;
        if (dl.ok || dl.cancelled) break;
        if (attempt < attempts) {
            LOG_WARN(entry.id + ": download attempt " + std::to_string(attempt) + "/" +
                     std::to_string(attempts) + " failed: " + dl.message + "; retrying");
        }
    }
    rep.endpoint_used = dl.endpoint_used;
    if (dl.cancelled) {
        // Partial file stays in staging for the next run
        cancelled(rep, "during download");
        return;
    }
    if (!dl.ok) {
        fail(rep, dl.failure, entry.id + ": " + dl.message, tally);
        return;
    }
    rep.state = EntryState::DOWNLOADED;

    // ---- DOWNLOADED -> VERIFIED (mismatch is recorded, not fatal) ----
    if (!config_.verify_checksums) {
        LOG_INFO("Skipping checksum verification for file " + target);
    } else {
        std::string why;
        if (verify_entry(entry, target, why)) {
            LOG_INFO("Checksum verification passed for file " + target);
        } else {
            fail(rep, FailureKind::CHECKSUM_MISMATCH,
                 entry.id + ": " + why + ". Data may be corrupted.", tally);
        }
    }
    rep.state = EntryState::VERIFIED;

    if (cancel_.cancelled()) {
        cancelled(rep, "before extraction");
        return;
    }

    // ---- VERIFIED -> EXTRACTED ----
    archive::ScanResult scan;
    try {
        scan = archive::scan_and_extract(staging.string());
    } catch (const std::exception& e) {
        fail(rep, FailureKind::EXTRACTION_FAILED, entry.id + ": " + e.what(), tally);
        clear_staging(staging.string());
        return;
    }
    if (!scan.failed.empty()) {
        std::vector<std::string> errors;
        for (auto& f : scan.failed) {
            errors.push_back(f.error);
            quarantine(f.path, run_dir, entry.id);
        }
        fail(rep, FailureKind::EXTRACTION_FAILED,
             "Errors encountered untarring data for " + entry.id + ": " +
             utils::join(errors, "; "), tally);
        clear_staging(staging.string());
        return;
    }
    rep.state = EntryState::EXTRACTED;

    if (cancel_.cancelled()) {
        cancelled(rep, "before upload");
        return;
    }

    // ---- EXTRACTED -> UPLOADED ----
    std::vector<fs::path> items;
    for (fs::directory_iterator it(staging, ec), end; !ec && it != end; it.increment(ec)) {
        items.push_back(it->path());
    }
    if (ec) {
        fail(rep, FailureKind::UPLOAD_FAILED,
             "cannot list " + staging.string() + ": " + ec.message(), tally);
        clear_staging(staging.string());
        return;
    }
    std::sort(items.begin(), items.end());

    std::string dest = upload_dest();
    LOG_INFO("Uploading " + entry.id + " to " + normalize_bucket(dest));
    for (const auto& item : items) {
        UploadResult up = uploader_.put(item.string(), dest, fs::is_directory(item, ec));
        if (!up.ok) {
            if (cancel_.cancelled()) {
                cancelled(rep, "during upload");
                return;
            }
            fail(rep, FailureKind::UPLOAD_FAILED,
                 "Error uploading " + entry.id + ": " + up.diagnostic, tally);
            clear_staging(staging.string());
            return;
        }
    }
    rep.state = EntryState::UPLOADED;

    clear_staging(staging.string());

    try {
        index.mark_done(entry.id, scan.groups);
    } catch (const std::exception& e) {
        LOG_WARN(entry.id + ": completion index not updated: " + e.what());
    }
    groups_out = std::move(scan.groups);
    rep.state = EntryState::DONE;
    LOG_INFO(entry.id + ": done");
    return;
}

void TransferOrchestrator::fail(EntryReport& rep, FailureKind kind,
                                const std::string& msg, FailureTally& tally)
{
    rep.failures.push_back(kind);
    rep.message = msg;
    tally.add(kind);
    // A checksum mismatch lets the remaining stages run
    if (kind != FailureKind::CHECKSUM_MISMATCH) rep.state = EntryState::FAILED;
    Logger::get().transfer_error(std::string(failure_name(kind)) + ": " + msg);
}

void TransferOrchestrator::cancelled(EntryReport& rep, const std::string& where) {
    rep.state = EntryState::CANCELLED;
    rep.message = "cancelled " + where;
    LOG_WARN(rep.id + ": " + rep.message);
}

bool TransferOrchestrator::verify_entry(const ManifestEntry& entry, const std::string& path,
                                        std::string& why) const
{
    try {
        hash::DigestAlgo algo = config_.digest_algo;
        std::string expected = entry.checksum;
        if (!config_.force_digest) {
            checksum::ExpectedDigest exp;
            if (!checksum::parse_expected(entry.checksum, exp)) {
                why = "unrecognised checksum '" + entry.checksum + "' for file " + path;
                return false;
            }
            algo = exp.algo;
            expected = exp.hex;
        }
        LOG_DEBUG(entry.id + ": verifying " + path + " with " + hash::algo_name(algo));
        bool ok = checksum::verify(path, expected, algo, CHECKSUM_CHUNK_SIZE);
        if (!ok) {
            why = std::string(hash::algo_name(algo)) + " checksum check failed for the file " + path;
        }
        return ok;
    } catch (const std::exception& e) {
        why = "cannot checksum " + path + ": " + e.what();
        return false;
    }
}

void TransferOrchestrator::quarantine(const std::string& archive, const std::string& run_dir,
                                      const std::string& id)
{
    if (!config_.quarantine_failed_archives) return;
    fs::path dest = fs::path(run_dir) / QUARANTINE_DIR_NAME / entry_dir_name(id) /
                    fs::path(archive).filename();
    try {
        file_io::ensure_parent_dirs(dest.string());
        file_io::move_file(archive, dest.string());
        LOG_WARN("Archive kept for inspection at " + dest.string());
    } catch (const std::exception& e) {
        LOG_WARN("cannot quarantine " + archive + ": " + e.what());
    }
}

void TransferOrchestrator::clear_staging(const std::string& staging) {
    try {
        size_t n = file_io::clear_directory(staging);
        LOG_DEBUG("cleared " + std::to_string(n) + " entries from " + staging);
        std::error_code ec;
        fs::remove(staging, ec);
    } catch (const std::exception& e) {
        LOG_WARN("cannot clear staging directory " + staging + ": " + e.what());
    }
}

std::string TransferOrchestrator::upload_dest() const {
    std::string bucket = config_.bucket;
    while (!bucket.empty() && bucket.back() == '/') bucket.pop_back();
    return bucket + "/" + config_.run_name + "/" + STAGING_DIR_NAME + "/";
}
