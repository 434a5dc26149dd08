#pragma once

// ============================================================
// uploader.hpp -- Put local paths into a storage bucket
// ============================================================

#include "../common/cancel.hpp"
#include <string>

struct UploadResult {
    bool ok{false};
    std::string diagnostic;  // set when !ok
};

// Storage backend seam; never throws for an ordinary upload failure
class Uploader {
public:
    virtual ~Uploader() = default;

    // Copy local_path to dest (a bucket identifier, optionally with a
    // folder path). recursive copies a directory tree.
    virtual UploadResult put(const std::string& local_path,
                             const std::string& dest,
                             bool recursive) = 0;
};

// "bucket/path" -> "gs://bucket/path"; already prefixed values are kept
std::string normalize_bucket(const std::string& bucket);

// Runs "<program> cp [-r] <local> <gs://dest>" as a child process
class GsutilUploader : public Uploader {
public:
    explicit GsutilUploader(std::string program = "gsutil",
                            const CancelToken* cancel = nullptr)
        : program_(std::move(program)), cancel_(cancel) {}

    UploadResult put(const std::string& local_path,
                     const std::string& dest,
                     bool recursive) override;

private:
    std::string program_;
    const CancelToken* cancel_;
};
