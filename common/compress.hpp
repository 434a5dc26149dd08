#pragma once

// ============================================================
// compress.hpp -- zstd streaming decompression wrapper
// ============================================================

#include "platform.hpp"
#include "file_io.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Decompresses a zstd stream (one or more frames) pulled from an inner reader
class ZstdReader : public file_io::ByteReader {
public:
    explicit ZstdReader(file_io::ByteReader& inner)
        : inner_(inner)
        , in_buf_(ZSTD_DStreamInSize())
    {
        dctx_ = ZSTD_createDCtx();
        if (!dctx_) throw std::runtime_error("ZSTD_createDCtx failed");
        in_ = ZSTD_inBuffer{in_buf_.data(), 0, 0};
    }

    ~ZstdReader() override {
        if (dctx_) ZSTD_freeDCtx(dctx_);
    }

    ZstdReader(const ZstdReader&) = delete;
    ZstdReader& operator=(const ZstdReader&) = delete;

    size_t read(void* buf, size_t len) override {
        if (len == 0) return 0;
        ZSTD_outBuffer out{buf, len, 0};
        while (out.pos == 0) {
            if (in_.pos == in_.size) {
                if (inner_eof_) {
                    if (!frame_done_) {
                        throw std::runtime_error("zstd stream truncated");
                    }
                    return 0;
                }
                size_t n = inner_.read(in_buf_.data(), in_buf_.size());
                if (n == 0) {
                    inner_eof_ = true;
                    continue;
                }
                in_ = ZSTD_inBuffer{in_buf_.data(), n, 0};
            }
            size_t rc = ZSTD_decompressStream(dctx_, &out, &in_);
            if (ZSTD_isError(rc)) {
                throw std::runtime_error(std::string("ZSTD decompress error: ") +
                                         ZSTD_getErrorName(rc));
            }
            // rc == 0: a frame ended exactly here
            frame_done_ = (rc == 0);
        }
        return out.pos;
    }

private:
    file_io::ByteReader& inner_;
    ZSTD_DCtx*           dctx_{nullptr};
    std::vector<char>    in_buf_;
    ZSTD_inBuffer        in_{};
    bool                 inner_eof_{false};
    bool                 frame_done_{true};
};

} // namespace compress
