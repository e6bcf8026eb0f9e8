#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <zstd.h>

#include "io/byte_stream.hpp"

namespace rkpi2 {

// Compresses everything written through it into one zstd frame on the inner sink.
// flush() pushes out a complete block; finish() must be called to close the frame
// before the inner sink is closed, otherwise the frame is left open.
class ZstdSink : public ByteSink {
public:
    // Takes ownership of inner. Throws Error(IO) if level is outside
    // 1..ZSTD_maxCLevel() or the compression context cannot be created.
    ZstdSink(std::unique_ptr<ByteSink> inner, int level);

    void write(const uint8_t* data, size_t n) override;
    void flush() override;
    void finish() override;
    using ByteSink::write;

    int level() const { return level_; }

private:
    struct CCtxDeleter {
        void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
    };

    void drain(ZSTD_EndDirective mode);

    std::unique_ptr<ByteSink> inner_;
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx_;
    std::vector<uint8_t> out_buf_;
    int level_;
    bool finished_ = false;
};

// Decompresses a zstd stream (one or more frames) read from the inner source.
class ZstdSource : public ByteSource {
public:
    // Takes ownership of inner. Throws Error(IO) if the context cannot be created.
    explicit ZstdSource(std::unique_ptr<ByteSource> inner);

    // Throws Error(IO) on corrupt data or when the inner source ends inside a frame.
    size_t read(uint8_t* out, size_t n) override;

private:
    struct DCtxDeleter {
        void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); }
    };

    std::unique_ptr<ByteSource> inner_;
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx_;
    std::vector<uint8_t> in_buf_;
    ZSTD_inBuffer in_{nullptr, 0, 0};
    size_t last_ret_ = 0; // 0 = no frame in progress
    bool fed_ = false;
};

} // namespace rkpi2
