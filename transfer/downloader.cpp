// ============================================================
// downloader.cpp -- Resumable block-wise download
// ============================================================

#include "downloader.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>

DownloadResult Downloader::download(const std::vector<EndpointCandidate>& candidates,
                                    const std::string& target_path,
                                    const std::string& partial_path,
                                    size_t block_size,
                                    const ProgressFn& progress,
                                    const std::string& label)
{
    DownloadResult res;
    TransferState& st = res.state;
    st.target_path  = target_path;
    st.partial_path = partial_path;
    const std::string& tag = label.empty() ? target_path : label;

    if (file_io::exists(target_path)) {
        LOG_INFO(tag + ": file already exists, skipping download");
        res.ok = true;
        res.skipped = true;
        st.total_size = st.bytes_received = file_io::get_file_size(target_path);
        return res;
    }

    if (block_size == 0) block_size = 1;
    const u64 cursor = file_io::get_file_size(partial_path);

    // ---- pick the first endpoint that gives us a live connection ----
    std::unique_ptr<EndpointConnection> conn;
    Scheme used_scheme = Scheme::UNKNOWN;
    u64 start = 0;
    u64 total = 0;
    bool chosen = false;
    std::vector<std::string> tried;

    for (const auto& cand : candidates) {
        if (cancelled()) break;
        tried.push_back(scheme_name(cand.scheme));

        EndpointSource* src = sources_.find(cand.scheme);
        if (!src) {
            LOG_WARN(tag + ": no backend for " + std::string(scheme_name(cand.scheme)) +
                     " endpoint " + cand.url);
            res.message = "no backend for " + cand.url;
            continue;
        }

        try {
            total = src->content_length(cand.url);
            start = cursor;
            if (start > total) {
                LOG_WARN(tag + ": partial file (" + std::to_string(start) +
                         " bytes) is larger than the remote file (" +
                         std::to_string(total) + " bytes), restarting");
                start = 0;
            }
            if (start > 0 && !src->supports_resume()) {
                LOG_INFO(tag + ": " + scheme_name(cand.scheme) +
                         " endpoint cannot resume, fetching from the start");
                start = 0;
            }

            if (start > 0 && start == total) {
                // Everything arrived last time; only the rename is missing
                LOG_INFO(tag + ": partial file already complete");
            } else {
                conn = src->open(cand.url, start);
                u64 s = conn->start_offset();
                if (s > start) {
                    throw std::runtime_error("stream starts at " + std::to_string(s) +
                                             ", past requested offset " +
                                             std::to_string(start));
                }
                if (s < start) {
                    LOG_INFO(tag + ": endpoint ignored the range request, restarting at " +
                             std::to_string(s));
                    start = s;
                }
            }
            res.endpoint_used = cand.url;
            used_scheme = cand.scheme;
            chosen = true;
            break;
        } catch (const std::exception& e) {
            LOG_WARN(tag + ": endpoint " + cand.url + " unavailable: " + e.what());
            res.message = e.what();
            conn.reset();
        }
    }

    if (!chosen) {
        if (cancelled()) {
            res.cancelled = true;
            res.message = "cancelled before a connection was made";
            return res;
        }
        res.failure = FailureKind::ENDPOINT_UNREACHABLE;
        res.message = "none of the URLs checked [" + utils::join(tried, ",") +
                      "] yielded a valid file" +
                      (res.message.empty() ? "" : " (last error: " + res.message + ")");
        return res;
    }

    st.total_size     = total;
    st.bytes_received = start;
    res.resumed_from  = start;

    // ---- transfer loop ----
    if (conn) {
        LOG_INFO("Downloading " + tag + " (via " + scheme_name(priority_bucket(used_scheme)) +
                 "): " + target_path + " | total bytes = " + std::to_string(total) +
                 (start > 0 ? " | resuming at " + std::to_string(start) : ""));

        const bool single_block = (u64)block_size > total;
        if (single_block && progress) {
            ProgressEvent ev;
            ev.label = tag;
            ev.bytes_received = start;
            ev.total_size = total;
            ev.single_block = true;
            progress(ev);
        }

        // Enough room for the remainder plus one byte to catch an overrun
        u64 remaining = total - start;
        size_t buf_len = (size_t)std::min<u64>((u64)block_size, remaining + 1);
        std::vector<char> block(buf_len);

        file_io::AppendWriter out;
        try {
            out.open(partial_path, start);

            for (;;) {
                if (cancelled()) {
                    out.close();
                    res.cancelled = true;
                    res.message = "cancelled at " + std::to_string(st.bytes_received) +
                                  " of " + std::to_string(total) + " bytes";
                    LOG_INFO(tag + ": " + res.message + ", partial file kept");
                    return res;
                }

                size_t n = conn->read(block.data(), block.size());
                if (n == 0) break;

                if (st.bytes_received + n > total) {
                    throw std::runtime_error("endpoint sent more than the advertised " +
                                             std::to_string(total) + " bytes");
                }
                out.append(block.data(), n);
                st.bytes_received += n;
                res.bytes_written += n;

                if (progress && !single_block) {
                    ProgressEvent ev;
                    ev.label = tag;
                    ev.bytes_received = st.bytes_received;
                    ev.total_size = total;
                    progress(ev);
                }
            }
            out.close();
        } catch (const std::exception& e) {
            if (cancelled()) {
                res.cancelled = true;
                res.message = "cancelled at " + std::to_string(st.bytes_received) +
                              " of " + std::to_string(total) + " bytes";
                LOG_INFO(tag + ": " + res.message + ", partial file kept");
            } else {
                res.failure = FailureKind::ENDPOINT_UNREACHABLE;
                res.message = "transfer from " + res.endpoint_used + " broke at " +
                              std::to_string(st.bytes_received) + " of " +
                              std::to_string(total) + " bytes: " + e.what();
            }
            return res;
        }
        conn.reset();

        if (st.bytes_received != total) {
            res.failure = FailureKind::ENDPOINT_UNREACHABLE;
            res.message = "stream from " + res.endpoint_used + " ended at " +
                          std::to_string(st.bytes_received) + " of " +
                          std::to_string(total) + " bytes";
            return res;
        }
    } else {
        // Promote an already complete partial file; create it for empty remotes
        file_io::AppendWriter touch;
        try {
            touch.open(partial_path, total);
            touch.close();
        } catch (const std::exception& e) {
            res.failure = FailureKind::ENDPOINT_UNREACHABLE;
            res.message = e.what();
            return res;
        }
    }

    try {
        file_io::move_file(partial_path, target_path);
    } catch (const std::exception& e) {
        res.failure = FailureKind::ENDPOINT_UNREACHABLE;
        res.message = e.what();
        return res;
    }

    if (progress) {
        ProgressEvent ev;
        ev.label = tag;
        ev.bytes_received = st.bytes_received;
        ev.total_size = total;
        ev.finished = true;
        progress(ev);
    }

    res.ok = true;
    return res;
}
