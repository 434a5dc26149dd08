#pragma once

// ============================================================
// curl_source.hpp -- libcurl backend for HTTP/HTTPS/FTP with
//   byte-range resume and a pull-style read loop
// ============================================================

#include "endpoint_source.hpp"
#include "../common/cancel.hpp"
#include <curl/curl.h>
#include <string>
#include <vector>

// RAII guard for curl_global_init/cleanup; create one in main()
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlOptions {
    int  connect_timeout_s{60};
    int  stall_timeout_s{300};  // abort below 1 byte/s for this long (0 = off)
    size_t max_buffer{4 * 1024 * 1024}; // pause the transfer above this much unread data
    bool verbose{false};
    std::string user_agent{"seqferry/1.0"};
};

// Streaming GET driven through a curl multi handle so the caller can pull
// blocks at its own pace
class CurlConnection : public EndpointConnection {
public:
    CurlConnection(const std::string& url, u64 offset,
                   const CurlOptions& opts, const CancelToken* cancel);
    ~CurlConnection() override;

    CurlConnection(const CurlConnection&) = delete;
    CurlConnection& operator=(const CurlConnection&) = delete;

    u64 start_offset() const override { return start_offset_; }
    size_t read(void* buf, size_t len) override;

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_cb(char* buf, size_t size, size_t nitems, void* userdata);
    static int xferinfo_cb(void* p, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    // One perform step, waiting for socket activity if nothing arrived
    void pump();
    size_t available() const { return buf_.size() - buf_off_; }
    [[noreturn]] void fail(const std::string& what) const;

    std::string url_;
    u64   requested_offset_;
    u64   start_offset_{0};
    bool  is_http_;
    CurlOptions opts_;
    const CancelToken* cancel_;

    CURL*  easy_{nullptr};
    CURLM* multi_{nullptr};
    char   errbuf_[CURL_ERROR_SIZE];

    std::vector<char> buf_;
    size_t buf_off_{0};
    bool   paused_{false};
    bool   headers_done_{false};
    bool   done_{false};
    CURLcode result_{CURLE_OK};
    long   status_{0};
    std::string content_range_;
};

class CurlSource : public EndpointSource {
public:
    explicit CurlSource(CurlOptions opts = {}, const CancelToken* cancel = nullptr)
        : opts_(std::move(opts)), cancel_(cancel) {}

    bool supports_resume() const override { return true; }

    // HEAD request; falls back to a one-byte range request when the server
    // does not report Content-Length for HEAD
    u64 content_length(const std::string& url) override;

    std::unique_ptr<EndpointConnection> open(const std::string& url, u64 offset) override;

private:
    CurlOptions opts_;
    const CancelToken* cancel_;

    u64 query_length(const std::string& url);
};
