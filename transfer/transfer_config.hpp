#pragma once

// ============================================================
// transfer_config.hpp -- Run configuration and defaults
// ============================================================

#include "../common/platform.hpp"
#include "../common/hash.hpp"
#include "endpoint_selector.hpp"
#include <string>
#include <vector>

// Network read block (bytes) per iteration of the download loop
static constexpr size_t DEFAULT_BLOCK_SIZE = 1000000;
// Local read chunk for checksum streaming; independent of the network block
static constexpr size_t CHECKSUM_CHUNK_SIZE = 64 * 1024;
// Download attempts per entry; later attempts resume from the partial file
static constexpr int DEFAULT_DOWNLOAD_ATTEMPTS = 3;
static constexpr int DEFAULT_CONNECT_TIMEOUT_S = 60;
// Abort a transfer that delivers under 1 byte/s for this long
static constexpr int DEFAULT_STALL_TIMEOUT_S = 300;

static constexpr const char* DEFAULT_PRIORITIES     = "HTTP,S3";
static constexpr const char* DEFAULT_S3_GATEWAY     = "https://{bucket}.s3.amazonaws.com/{key}";
static constexpr const char* DEFAULT_UPLOADER       = "gsutil";
static constexpr const char* RUN_NAME_PREFIX        = "upload-";
static constexpr const char* STAGING_DIR_NAME       = "fastqs";
static constexpr const char* QUARANTINE_DIR_NAME    = "quarantine";
static constexpr const char* PARTIAL_SUFFIX         = ".partial";
static constexpr const char* TRANSFER_INDEX_NAME    = ".transfer_index";
static constexpr const char* FAILURE_LOG_NAME       = "transfer_errors.log";

struct TransferConfig {
    std::vector<std::string> priorities;     // empty = HTTP then S3
    std::vector<UrlRewriteRule> rewrite_rules;
    size_t block_size{DEFAULT_BLOCK_SIZE};
    int    download_attempts{DEFAULT_DOWNLOAD_ATTEMPTS};
    size_t workers{1};
    bool   verify_checksums{true};
    bool   force_digest{false};              // use digest_algo for every entry
    hash::DigestAlgo digest_algo{hash::DigestAlgo::MD5};
    bool   quarantine_failed_archives{true};
    std::string bucket;                      // without or with gs:// prefix
    std::string run_name;                    // names the remote folder
};
