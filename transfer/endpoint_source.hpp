#pragma once

// ============================================================
// endpoint_source.hpp -- Pluggable retrieval backends per scheme
// ============================================================

#include "transfer_types.hpp"
#include <map>
#include <memory>
#include <string>

// A live byte stream from one endpoint
class EndpointConnection {
public:
    virtual ~EndpointConnection() = default;

    // Offset of the first byte this stream delivers. Equals the requested
    // offset when the range was honoured, 0 when the server sent everything.
    virtual u64 start_offset() const = 0;

    // Read up to len bytes. Returns 0 when the remote stream is exhausted.
    // Throws std::runtime_error if the connection breaks.
    virtual size_t read(void* buf, size_t len) = 0;
};

// One retrieval backend (HTTP(S), S3 gateway, test fake, ...)
class EndpointSource {
public:
    virtual ~EndpointSource() = default;

    // Whether open() can start at a non-zero offset
    virtual bool supports_resume() const = 0;

    // Authoritative remote size in bytes; throws std::runtime_error
    virtual u64 content_length(const std::string& url) = 0;

    // Connect and start streaming at offset (0 if !supports_resume()).
    // Throws std::runtime_error if no live connection can be made.
    virtual std::unique_ptr<EndpointConnection> open(const std::string& url, u64 offset) = 0;
};

// Scheme -> backend. HTTPS falls back to the HTTP backend when it has no
// backend of its own.
class SourceRegistry {
public:
    void add(Scheme scheme, std::shared_ptr<EndpointSource> source) {
        sources_[scheme] = std::move(source);
    }

    EndpointSource* find(Scheme scheme) const {
        auto it = sources_.find(scheme);
        if (it != sources_.end()) return it->second.get();
        if (scheme == Scheme::HTTPS) return find(Scheme::HTTP);
        return nullptr;
    }

private:
    std::map<Scheme, std::shared_ptr<EndpointSource>> sources_;
};
