// ============================================================
// curl_source_test.cpp -- libcurl backend against a loopback
//   HTTP server that honours Range
// ============================================================

#include "test_support.hpp"
#include "transfer/curl_source.hpp"
#include "transfer/downloader.hpp"
#include "transfer/s3_source.hpp"
#include "common/utils.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>

// Minimal HTTP/1.1 server: one connection at a time, Connection: close
class LoopbackHttpServer {
public:
    struct Resource {
        std::string body;
        bool honour_range{true};
        bool head_length{true};      // send Content-Length on HEAD
        size_t truncate_at{SIZE_MAX}; // close the socket after this many body bytes
    };

    LoopbackHttpServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0 || ::listen(fd_, 16) != 0) {
            ::close(fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, (sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackHttpServer() {
        stop_.store(true);
        thread_.join();
        ::close(fd_);
    }

    void add(const std::string& path, Resource r) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[path] = std::move(r);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Range headers seen, in order ("" when absent)
    std::vector<std::string> ranges() {
        std::lock_guard<std::mutex> lk(mutex_);
        return ranges_;
    }

    std::vector<std::string> methods() {
        std::lock_guard<std::mutex> lk(mutex_);
        return methods_;
    }

private:
    void serve() {
        while (!stop_.load()) {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 50) <= 0) continue;
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) continue;
            handle(c);
            ::close(c);
        }
    }

    static void send_all(int c, const char* data, size_t len) {
        while (len > 0) {
            ssize_t n = ::send(c, data, len, MSG_NOSIGNAL);
            if (n <= 0) return;
            data += n;
            len -= (size_t)n;
        }
    }

    void handle(int c) {
        std::string req;
        char buf[4096];
        while (req.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(c, buf, sizeof(buf), 0);
            if (n <= 0) return;
            req.append(buf, (size_t)n);
        }

        std::istringstream in(req);
        std::string method, path, version, line, range;
        in >> method >> path >> version;
        std::getline(in, line);
        while (std::getline(in, line) && line != "\r") {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = utils::to_lower(line.substr(0, colon));
            if (name == "range") range = utils::trim(line.substr(colon + 1));
        }

        Resource res;
        bool found;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ranges_.push_back(range);
            methods_.push_back(method);
            auto it = resources_.find(path);
            found = it != resources_.end();
            if (found) res = it->second;
        }

        if (!found) {
            std::string resp = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
            send_all(c, resp.data(), resp.size());
            return;
        }

        const std::string& body = res.body;
        u64 start = 0, end = body.empty() ? 0 : body.size() - 1;
        bool partial = false;
        if (res.honour_range && utils::starts_with(range, "bytes=")) {
            std::string span = range.substr(6);
            auto dash = span.find('-');
            u64 a = 0, b = 0;
            if (dash != std::string::npos && utils::parse_u64(span.substr(0, dash), a)) {
                if (!utils::parse_u64(span.substr(dash + 1), b)) b = body.size() - 1;
                if (a >= body.size()) {
                    std::string resp = "HTTP/1.1 416 Range Not Satisfiable\r\nContent-Range: bytes */" +
                                       std::to_string(body.size()) + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
                    send_all(c, resp.data(), resp.size());
                    return;
                }
                start = a;
                end = std::min<u64>(b, body.size() - 1);
                partial = true;
            }
        }

        u64 len = body.empty() ? 0 : end - start + 1;
        std::string head = partial ? "HTTP/1.1 206 Partial Content\r\n" : "HTTP/1.1 200 OK\r\n";
        if (partial) {
            head += "Content-Range: bytes " + std::to_string(start) + "-" + std::to_string(end) +
                    "/" + std::to_string(body.size()) + "\r\n";
        }
        if (method != "HEAD" || res.head_length) {
            head += "Content-Length: " + std::to_string(len) + "\r\n";
        }
        head += "Connection: close\r\n\r\n";
        send_all(c, head.data(), head.size());

        if (method == "HEAD") return;
        size_t send_len = (size_t)std::min<u64>(len, res.truncate_at);
        send_all(c, body.data() + start, send_len);
    }

    int fd_{-1};
    u16 port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::vector<std::string> ranges_;
    std::vector<std::string> methods_;
};

static std::string read_all(EndpointConnection& c, size_t block) {
    std::string out;
    std::vector<char> buf(block);
    for (;;) {
        size_t n = c.read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(buf.data(), n);
    }
    return out;
}

static CurlOptions test_options() {
    CurlOptions o;
    o.connect_timeout_s = 5;
    o.stall_timeout_s = 10;
    o.max_buffer = 64 * 1024;  // exercise pause/unpause
    return o;
}

bool test_content_length_via_head() {
    std::cout << "Testing HEAD size query..." << std::endl;
    LoopbackHttpServer srv;
    srv.add("/a.tar", {make_payload(12345)});
    CurlSource src(test_options());
    TEST_ASSERT(src.content_length(srv.url("/a.tar")) == 12345, "HEAD Content-Length");
    TEST_ASSERT(srv.methods().size() == 1 && srv.methods()[0] == "HEAD", "one HEAD request");
    return true;
}

bool test_content_length_range_fallback() {
    std::cout << "Testing one-byte range request when HEAD has no length..." << std::endl;
    LoopbackHttpServer srv;
    LoopbackHttpServer::Resource r{make_payload(777)};
    r.head_length = false;
    srv.add("/b", r);
    CurlSource src(test_options());
    TEST_ASSERT(src.content_length(srv.url("/b")) == 777, "length from Content-Range total");
    auto ranges = srv.ranges();
    TEST_ASSERT(ranges.size() == 2 && ranges[1] == "bytes=0-0", "second request asks for one byte");
    return true;
}

bool test_missing_resource_throws() {
    std::cout << "Testing 404..." << std::endl;
    LoopbackHttpServer srv;
    CurlSource src(test_options());
    bool threw = false;
    try { src.content_length(srv.url("/nope")); } catch (const std::runtime_error&) { threw = true; }
    TEST_ASSERT(threw, "size query of a 404 throws");

    threw = false;
    try { src.open(srv.url("/nope"), 0); } catch (const std::runtime_error&) { threw = true; }
    TEST_ASSERT(threw, "open of a 404 throws");
    return true;
}

bool test_full_and_ranged_get() {
    std::cout << "Testing full and ranged GET..." << std::endl;
    LoopbackHttpServer srv;
    std::string data = make_payload(300000, 4);
    srv.add("/c", {data});
    CurlSource src(test_options());

    auto full = src.open(srv.url("/c"), 0);
    TEST_ASSERT(full->start_offset() == 0, "full GET starts at 0");
    TEST_ASSERT(read_all(*full, 10000) == data, "full body");

    auto ranged = src.open(srv.url("/c"), 100000);
    TEST_ASSERT(ranged->start_offset() == 100000, "range honoured");
    TEST_ASSERT(read_all(*ranged, 7777) == data.substr(100000), "ranged body");
    TEST_ASSERT(srv.ranges().back() == "bytes=100000-", "Range header sent");
    return true;
}

bool test_range_ignored_reports_zero() {
    std::cout << "Testing server that ignores Range..." << std::endl;
    LoopbackHttpServer srv;
    std::string data = make_payload(5000, 6);
    LoopbackHttpServer::Resource r{data};
    r.honour_range = false;
    srv.add("/d", r);
    CurlSource src(test_options());
    auto conn = src.open(srv.url("/d"), 1000);
    TEST_ASSERT(conn->start_offset() == 0, "200 reply means the stream starts at 0");
    TEST_ASSERT(read_all(*conn, 4096) == data, "whole body delivered");
    return true;
}

bool test_truncated_body_throws() {
    std::cout << "Testing connection dropped mid-body..." << std::endl;
    LoopbackHttpServer srv;
    LoopbackHttpServer::Resource r{make_payload(50000)};
    r.truncate_at = 20000;
    srv.add("/e", r);
    CurlSource src(test_options());
    auto conn = src.open(srv.url("/e"), 0);
    bool threw = false;
    size_t got = 0;
    try {
        std::vector<char> buf(4096);
        for (;;) {
            size_t n = conn->read(buf.data(), buf.size());
            if (n == 0) break;
            got += n;
        }
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "short body must surface as an error");
    TEST_ASSERT(got == 20000, "bytes before the drop are delivered, got " << got);
    return true;
}

bool test_downloader_resumes_over_http() {
    std::cout << "Testing downloader resume over loopback HTTP..." << std::endl;
    LoopbackHttpServer srv;
    std::string data = make_payload(200000, 8);
    srv.add("/sample.tar", {data});

    TempDir dir;
    std::string target = dir / "sample.tar";
    std::string partial = target + ".partial";
    write_file(partial, data.substr(0, 64000));

    auto http = std::make_shared<CurlSource>(test_options());
    SourceRegistry reg;
    reg.add(Scheme::HTTP, http);
    Downloader dl(reg);
    auto r = dl.download({{Scheme::HTTP, srv.url("/sample.tar")}}, target, partial, 16384);
    TEST_ASSERT(r.ok, "download ok: " << r.message);
    TEST_ASSERT(r.bytes_written == data.size() - 64000, "only the missing suffix fetched");
    TEST_ASSERT(read_file(target) == data, "resumed content");
    TEST_ASSERT(srv.ranges().back() == "bytes=64000-", "GET resumed at the partial size");
    return true;
}

bool test_s3_gateway_mapping() {
    std::cout << "Testing S3 gateway through HTTP..." << std::endl;
    LoopbackHttpServer srv;
    std::string data = make_payload(3000, 12);
    srv.add("/mybucket/path/to/obj.tar", {data});

    auto http = std::make_shared<CurlSource>(test_options());
    S3Source s3(http, srv.url("/{bucket}/{key}"));
    TEST_ASSERT(s3.gateway_url("s3://mybucket/path/to/obj.tar") == srv.url("/mybucket/path/to/obj.tar"),
                "gateway URL");
    TEST_ASSERT(!s3.supports_resume(), "no resume through the gateway");
    TEST_ASSERT(s3.content_length("s3://mybucket/path/to/obj.tar") == 3000, "size via gateway");
    auto conn = s3.open("s3://mybucket/path/to/obj.tar", 0);
    TEST_ASSERT(read_all(*conn, 1000) == data, "body via gateway");

    bool threw = false;
    try { s3.gateway_url("s3://bucket-only"); } catch (const std::runtime_error&) { threw = true; }
    TEST_ASSERT(threw, "s3 URL without key rejected");
    return true;
}

int main() {
    Logger::get().set_level(LogLevel::ERR);
    CurlGlobal curl_global;

    bool ok = true;
    ok &= test_content_length_via_head();
    ok &= test_content_length_range_fallback();
    ok &= test_missing_resource_throws();
    ok &= test_full_and_ranged_get();
    ok &= test_range_ignored_reports_zero();
    ok &= test_truncated_body_throws();
    ok &= test_downloader_resumes_over_http();
    ok &= test_s3_gateway_mapping();

    if (!ok || tests_failed > 0) {
        std::cerr << tests_failed << " curl source test(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All curl source tests PASSED" << std::endl;
    return 0;
}
