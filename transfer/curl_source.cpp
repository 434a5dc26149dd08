// ============================================================
// curl_source.cpp -- libcurl backend for HTTP/HTTPS/FTP
// ============================================================

#include "curl_source.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

#define CURL_SETOPT(handle, option, value)                                     \
    do {                                                                       \
        CURLcode r_ = curl_easy_setopt(handle, option, value);                 \
        if (r_ != CURLE_OK) {                                                  \
            throw std::runtime_error(std::string("curl_easy_setopt(" #option   \
                                     ") failed: ") + curl_easy_strerror(r_));  \
        }                                                                      \
    } while (0)

// ============================================================
// CurlGlobal
// ============================================================

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

// ---- shared helpers ----

static bool is_http_url(const std::string& url) {
    Scheme s = scheme_of_url(url);
    return s == Scheme::HTTP || s == Scheme::HTTPS;
}

// Value of "Name: value" if line is that header (case-insensitive name)
static bool header_value(const std::string& line, const char* name, std::string& out) {
    size_t n = std::strlen(name);
    if (line.size() <= n || line[n] != ':') return false;
    if (utils::to_lower(line.substr(0, n)) != name) return false;
    out = utils::trim(line.substr(n + 1));
    return true;
}

// "HTTP/1.1 206 Partial Content" -> 206; 0 if not a status line
static long status_of(const std::string& line) {
    if (!utils::starts_with(line, "HTTP/")) return 0;
    auto sp = line.find(' ');
    if (sp == std::string::npos) return 0;
    return std::strtol(line.c_str() + sp + 1, nullptr, 10);
}

static int cancel_xferinfo(void* p, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancelToken*>(p);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

static void apply_common(CURL* h, const CurlOptions& opts, const CancelToken* cancel,
                         char* errbuf)
{
    CURL_SETOPT(h, CURLOPT_FOLLOWLOCATION, 1L);
    CURL_SETOPT(h, CURLOPT_MAXREDIRS, 10L);
    CURL_SETOPT(h, CURLOPT_FAILONERROR, 1L);
    CURL_SETOPT(h, CURLOPT_NOSIGNAL, 1L);
    CURL_SETOPT(h, CURLOPT_CONNECTTIMEOUT, (long)opts.connect_timeout_s);
    CURL_SETOPT(h, CURLOPT_USERAGENT, opts.user_agent.c_str());
    CURL_SETOPT(h, CURLOPT_ERRORBUFFER, errbuf);
    if (opts.stall_timeout_s > 0) {
        CURL_SETOPT(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        CURL_SETOPT(h, CURLOPT_LOW_SPEED_TIME, (long)opts.stall_timeout_s);
    }
    if (cancel) {
        CURL_SETOPT(h, CURLOPT_NOPROGRESS, 0L);
        CURL_SETOPT(h, CURLOPT_XFERINFOFUNCTION, cancel_xferinfo);
        CURL_SETOPT(h, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(cancel));
    }
    if (opts.verbose) {
        CURL_SETOPT(h, CURLOPT_VERBOSE, 1L);
    }
}

// ============================================================
// CurlConnection
// ============================================================

CurlConnection::CurlConnection(const std::string& url, u64 offset,
                               const CurlOptions& opts, const CancelToken* cancel)
    : url_(url)
    , requested_offset_(offset)
    , is_http_(is_http_url(url))
    , opts_(opts)
    , cancel_(cancel)
{
    errbuf_[0] = '\0';

    easy_ = curl_easy_init();
    if (!easy_) throw std::runtime_error("curl_easy_init failed");
    multi_ = curl_multi_init();
    if (!multi_) {
        curl_easy_cleanup(easy_);
        throw std::runtime_error("curl_multi_init failed");
    }

    try {
        CURL_SETOPT(easy_, CURLOPT_URL, url_.c_str());
        apply_common(easy_, opts_, nullptr, errbuf_);
        CURL_SETOPT(easy_, CURLOPT_WRITEFUNCTION, write_cb);
        CURL_SETOPT(easy_, CURLOPT_WRITEDATA, this);
        CURL_SETOPT(easy_, CURLOPT_HEADERFUNCTION, header_cb);
        CURL_SETOPT(easy_, CURLOPT_HEADERDATA, this);
        CURL_SETOPT(easy_, CURLOPT_NOPROGRESS, 0L);
        CURL_SETOPT(easy_, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        CURL_SETOPT(easy_, CURLOPT_XFERINFODATA, this);
        if (offset > 0) {
            // "Range: bytes=<offset>-" for HTTP, REST for FTP
            std::string range = std::to_string(offset) + "-";
            CURL_SETOPT(easy_, CURLOPT_RANGE, range.c_str());
        }

        CURLMcode mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            throw std::runtime_error(std::string("curl_multi_add_handle failed: ") +
                                     curl_multi_strerror(mc));
        }

        // Drive the request until the final response headers arrive (HTTP)
        // or the first bytes do (FTP)
        while (!done_) {
            if (is_http_ ? headers_done_ : available() > 0) break;
            pump();
        }

        if (done_ && result_ != CURLE_OK) fail("cannot connect to");

        if (is_http_) {
            if (status_ == 206) {
                std::string expect = "bytes " + std::to_string(offset) + "-";
                if (!content_range_.empty() && !utils::starts_with(content_range_, expect)) {
                    fail("unexpected Content-Range '" + content_range_ + "' from");
                }
                start_offset_ = offset;
            } else if (status_ >= 200 && status_ < 300) {
                start_offset_ = 0;
                if (offset > 0) {
                    LOG_DEBUG("server ignored range request for " + url_);
                }
            } else {
                fail("unexpected response from");
            }
        } else {
            start_offset_ = offset;
        }
    } catch (...) {
        if (multi_) {
            curl_multi_remove_handle(multi_, easy_);
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
        throw;
    }
}

CurlConnection::~CurlConnection() {
    if (multi_ && easy_) curl_multi_remove_handle(multi_, easy_);
    if (easy_)  curl_easy_cleanup(easy_);
    if (multi_) curl_multi_cleanup(multi_);
}

void CurlConnection::fail(const std::string& what) const {
    std::string msg = what + " " + url_ + ": ";
    if (result_ == CURLE_ABORTED_BY_CALLBACK) {
        msg += "cancelled";
    } else if (result_ != CURLE_OK) {
        msg += errbuf_[0] ? std::string(errbuf_) : std::string(curl_easy_strerror(result_));
    } else {
        msg += "HTTP status " + std::to_string(status_);
    }
    throw std::runtime_error(msg);
}

size_t CurlConnection::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlConnection*>(userdata);
    size_t n = size * nmemb;
    if (self->available() >= self->opts_.max_buffer) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    self->buf_.insert(self->buf_.end(), ptr, ptr + n);
    return n;
}

size_t CurlConnection::header_cb(char* buf, size_t size, size_t nitems, void* userdata) {
    auto* self = static_cast<CurlConnection*>(userdata);
    size_t n = size * nitems;
    std::string line(buf, n);

    long st = status_of(line);
    if (st != 0) {
        // A new response begins (redirects and 1xx produce several)
        self->status_ = st;
        self->headers_done_ = false;
        self->content_range_.clear();
        return n;
    }

    std::string value;
    if (header_value(line, "content-range", value)) {
        self->content_range_ = value;
    } else if (line == "\r\n" || line == "\n") {
        long s = self->status_;
        if (s >= 200 && (s < 300 || s >= 400)) self->headers_done_ = true;
    }
    return n;
}

int CurlConnection::xferinfo_cb(void* p, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlConnection*>(p);
    return (self->cancel_ && self->cancel_->cancelled()) ? 1 : 0;
}

void CurlConnection::pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        throw std::runtime_error(std::string("curl_multi_perform failed: ") +
                                 curl_multi_strerror(mc));
    }

    int queued = 0;
    while (CURLMsg* m = curl_multi_info_read(multi_, &queued)) {
        if (m->msg == CURLMSG_DONE) {
            result_ = m->data.result;
            done_ = true;
        }
    }
    if (running == 0) done_ = true;

    if (done_ || available() > 0 || paused_) return;

    mc = curl_multi_poll(multi_, nullptr, 0, 200, nullptr);
    if (mc != CURLM_OK) {
        throw std::runtime_error(std::string("curl_multi_poll failed: ") +
                                 curl_multi_strerror(mc));
    }
}

size_t CurlConnection::read(void* buf, size_t len) {
    if (len == 0) return 0;

    while (available() == 0) {
        buf_.clear();
        buf_off_ = 0;
        if (paused_) {
            paused_ = false;
            CURLcode rc = curl_easy_pause(easy_, CURLPAUSE_CONT);
            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("curl_easy_pause failed: ") +
                                         curl_easy_strerror(rc));
            }
            continue;
        }
        if (done_) {
            if (result_ != CURLE_OK) fail("transfer failed from");
            return 0;
        }
        pump();
    }

    size_t n = std::min(len, available());
    std::memcpy(buf, buf_.data() + buf_off_, n);
    buf_off_ += n;
    return n;
}

// ============================================================
// CurlSource
// ============================================================

std::unique_ptr<EndpointConnection> CurlSource::open(const std::string& url, u64 offset) {
    return std::make_unique<CurlConnection>(url, offset, opts_, cancel_);
}

u64 CurlSource::content_length(const std::string& url) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> h(curl_easy_init(), &curl_easy_cleanup);
    if (!h) throw std::runtime_error("curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    CURL_SETOPT(h.get(), CURLOPT_URL, url.c_str());
    CURL_SETOPT(h.get(), CURLOPT_NOBODY, 1L);
    apply_common(h.get(), opts_, cancel_, errbuf);

    CURLcode rc = curl_easy_perform(h.get());
    if (rc == CURLE_OK) {
        curl_off_t cl = -1;
        if (curl_easy_getinfo(h.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK &&
            cl >= 0) {
            return (u64)cl;
        }
    }

    std::string why = rc == CURLE_OK ? std::string("no Content-Length")
                    : (errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));
    if (rc == CURLE_ABORTED_BY_CALLBACK || !is_http_url(url)) {
        throw std::runtime_error("size query failed for " + url + ": " + why);
    }
    LOG_DEBUG("HEAD " + url + ": " + why + "; probing with a range request");
    return query_length(url);
}

namespace {

struct LengthQueryState {
    long status{0};
    std::string content_range;
    std::string content_length;
    size_t body_bytes{0};
};

size_t length_header_cb(char* buf, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<LengthQueryState*>(userdata);
    size_t n = size * nitems;
    std::string line(buf, n);
    long s = status_of(line);
    if (s != 0) {
        st->status = s;
        st->content_range.clear();
        st->content_length.clear();
        return n;
    }
    std::string value;
    if (header_value(line, "content-range", value))  st->content_range = value;
    if (header_value(line, "content-length", value)) st->content_length = value;
    return n;
}

// Stop as soon as the server sends more than the one byte asked for
size_t length_write_cb(char*, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<LengthQueryState*>(userdata);
    st->body_bytes += size * nmemb;
    return st->body_bytes > 1 ? 0 : size * nmemb;
}

} // namespace

u64 CurlSource::query_length(const std::string& url) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> h(curl_easy_init(), &curl_easy_cleanup);
    if (!h) throw std::runtime_error("curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    LengthQueryState st;
    CURL_SETOPT(h.get(), CURLOPT_URL, url.c_str());
    apply_common(h.get(), opts_, cancel_, errbuf);
    CURL_SETOPT(h.get(), CURLOPT_RANGE, "0-0");
    CURL_SETOPT(h.get(), CURLOPT_HEADERFUNCTION, length_header_cb);
    CURL_SETOPT(h.get(), CURLOPT_HEADERDATA, &st);
    CURL_SETOPT(h.get(), CURLOPT_WRITEFUNCTION, length_write_cb);
    CURL_SETOPT(h.get(), CURLOPT_WRITEDATA, &st);

    CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK && rc != CURLE_WRITE_ERROR) {
        throw std::runtime_error("size query failed for " + url + ": " +
                                 (errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc)));
    }

    u64 total = 0;
    if (st.status == 206) {
        auto slash = st.content_range.rfind('/');
        if (slash != std::string::npos &&
            utils::parse_u64(st.content_range.substr(slash + 1), total)) {
            return total;
        }
    } else if (st.status == 200 && utils::parse_u64(st.content_length, total)) {
        return total;
    }
    throw std::runtime_error("size query failed for " + url +
                             ": server reports no length (status " +
                             std::to_string(st.status) + ")");
}
