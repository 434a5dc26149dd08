// ============================================================
// uploader.cpp -- gsutil-style storage upload
// ============================================================

#include "uploader.hpp"
#include "../common/logger.hpp"
#include "../common/subprocess.hpp"
#include "../common/utils.hpp"
#include <vector>

std::string normalize_bucket(const std::string& bucket) {
    if (utils::starts_with(bucket, "gs://")) return bucket;
    return "gs://" + bucket;
}

UploadResult GsutilUploader::put(const std::string& local_path,
                                 const std::string& dest,
                                 bool recursive)
{
    UploadResult res;
    std::string target = normalize_bucket(dest);

    std::vector<std::string> argv{program_, "cp"};
    if (recursive) argv.push_back("-r");
    argv.push_back(local_path);
    argv.push_back(target);

    LOG_DEBUG("upload: " + utils::join(argv, " "));

    subprocess::Result r;
    try {
        r = subprocess::run(argv, cancel_);
    } catch (const std::exception& e) {
        res.diagnostic = "cannot run " + program_ + ": " + e.what();
        return res;
    }

    if (r.exit_code == 0 && r.signal == 0 && !r.cancelled) {
        LOG_INFO("Successfully uploaded " + local_path + " to " + target);
        res.ok = true;
        return res;
    }

    res.diagnostic = "upload of " + local_path + " to " + target + " failed: " +
                     subprocess::describe(r);
    std::string tail = utils::trim(r.output);
    if (!tail.empty()) res.diagnostic += "\n" + tail;
    return res;
}
