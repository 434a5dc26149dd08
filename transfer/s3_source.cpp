// ============================================================
// s3_source.cpp -- s3:// URLs through a public HTTPS gateway
// ============================================================

#include "s3_source.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

S3Source::S3Source(std::shared_ptr<EndpointSource> http, std::string gateway_template)
    : http_(std::move(http))
    , gateway_template_(std::move(gateway_template))
{
    if (!http_) throw std::invalid_argument("S3Source needs an HTTP source");
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string S3Source::gateway_url(const std::string& s3_url) const {
    static const std::string prefix = "s3://";
    if (s3_url.size() <= prefix.size() ||
        s3_url.compare(0, prefix.size(), prefix) != 0) {
        throw std::runtime_error("not an s3:// URL: " + s3_url);
    }
    std::string rest = s3_url.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == 0 || slash == std::string::npos || slash + 1 >= rest.size()) {
        throw std::runtime_error("s3 URL needs bucket and key: " + s3_url);
    }
    std::string out = gateway_template_;
    replace_all(out, "{bucket}", rest.substr(0, slash));
    replace_all(out, "{key}", rest.substr(slash + 1));
    return out;
}

u64 S3Source::content_length(const std::string& url) {
    return http_->content_length(gateway_url(url));
}

std::unique_ptr<EndpointConnection> S3Source::open(const std::string& url, u64 offset) {
    if (offset != 0) {
        LOG_DEBUG("S3 gateway fetch ignores resume offset " + std::to_string(offset));
    }
    std::string gw = gateway_url(url);
    LOG_DEBUG("S3 " + url + " via " + gw);
    return http_->open(gw, 0);
}
