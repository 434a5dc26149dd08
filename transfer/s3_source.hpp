#pragma once

// ============================================================
// s3_source.hpp -- s3:// URLs fetched through a public HTTPS
//   gateway (no S3 wire protocol, no resume)
// ============================================================

#include "endpoint_source.hpp"
#include <memory>
#include <string>

class S3Source : public EndpointSource {
public:
    // gateway_template may use {bucket} and {key}
    S3Source(std::shared_ptr<EndpointSource> http, std::string gateway_template);

    // Anonymous gateway reads are re-fetched in full
    bool supports_resume() const override { return false; }

    u64 content_length(const std::string& url) override;
    std::unique_ptr<EndpointConnection> open(const std::string& url, u64 offset) override;

    // "s3://bucket/some/key" -> gateway URL; throws on a malformed s3 URL
    std::string gateway_url(const std::string& s3_url) const;

private:
    std::shared_ptr<EndpointSource> http_;
    std::string gateway_template_;
};
