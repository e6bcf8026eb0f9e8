#include "io/zstd_stream.hpp"
#include "format/rkpi2_error.hpp"

#include <string>

namespace rkpi2 {

namespace {
static void check_zstd(size_t ret, const char* what) {
    if (ZSTD_isError(ret)) {
        throw Error(ErrorKind::IO, std::string(what) + ": " + ZSTD_getErrorName(ret));
    }
}
} // namespace

ZstdSink::ZstdSink(std::unique_ptr<ByteSink> inner, int level)
    : inner_(std::move(inner)), level_(level) {
    if (!inner_) throw Error(ErrorKind::IO, "zstd: null inner sink");
    if (level < 1 || level > ZSTD_maxCLevel()) {
        throw Error(ErrorKind::IO, "zstd: compression level " + std::to_string(level) +
                                   " not in 1.." + std::to_string(ZSTD_maxCLevel()));
    }
    cctx_.reset(ZSTD_createCCtx());
    if (!cctx_) throw Error(ErrorKind::IO, "zstd: cannot create compression context");
    check_zstd(ZSTD_CCtx_setParameter(cctx_.get(), ZSTD_c_compressionLevel, level),
               "zstd: set level");
    out_buf_.resize(ZSTD_CStreamOutSize());
}

void ZstdSink::write(const uint8_t* data, size_t n) {
    if (finished_) throw Error(ErrorKind::IO, "zstd: write after finish");
    if (n == 0) return;
    if (!data) throw Error(ErrorKind::IO, "zstd: write null data");

    ZSTD_inBuffer in{data, n, 0};
    while (in.pos < in.size) {
        ZSTD_outBuffer out{out_buf_.data(), out_buf_.size(), 0};
        check_zstd(ZSTD_compressStream2(cctx_.get(), &out, &in, ZSTD_e_continue), "zstd: compress");
        if (out.pos != 0) inner_->write(out_buf_.data(), out.pos);
    }
}

void ZstdSink::drain(ZSTD_EndDirective mode) {
    ZSTD_inBuffer in{nullptr, 0, 0};
    size_t remaining = 0;
    do {
        ZSTD_outBuffer out{out_buf_.data(), out_buf_.size(), 0};
        remaining = ZSTD_compressStream2(cctx_.get(), &out, &in, mode);
        check_zstd(remaining, "zstd: flush");
        if (out.pos != 0) inner_->write(out_buf_.data(), out.pos);
    } while (remaining != 0);
}

void ZstdSink::flush() {
    if (finished_) {
        inner_->flush();
        return;
    }
    drain(ZSTD_e_flush);
    inner_->flush();
}

void ZstdSink::finish() {
    if (finished_) return;
    drain(ZSTD_e_end);
    finished_ = true;
    inner_->finish();
}

ZstdSource::ZstdSource(std::unique_ptr<ByteSource> inner)
    : inner_(std::move(inner)) {
    if (!inner_) throw Error(ErrorKind::IO, "zstd: null inner source");
    dctx_.reset(ZSTD_createDCtx());
    if (!dctx_) throw Error(ErrorKind::IO, "zstd: cannot create decompression context");
    in_buf_.resize(ZSTD_DStreamInSize());
    in_ = ZSTD_inBuffer{in_buf_.data(), 0, 0};
}

size_t ZstdSource::read(uint8_t* out, size_t n) {
    if (n == 0) return 0;
    if (!out) throw Error(ErrorKind::IO, "zstd: read into null buffer");

    ZSTD_outBuffer o{out, n, 0};
    while (true) {
        // Drain what the context already holds before touching the inner source.
        if (fed_) {
            const size_t in_before = in_.pos;
            const size_t ret = ZSTD_decompressStream(dctx_.get(), &o, &in_);
            check_zstd(ret, "zstd: decompress");
            // An idle call between frames returns a size hint, not "frame open".
            if (ret == 0 || in_.pos != in_before || o.pos != 0) last_ret_ = ret;
            if (o.pos != 0) return o.pos;
            if (in_.pos < in_.size) continue;
        }

        const size_t got = inner_->read(in_buf_.data(), in_buf_.size());
        if (got == 0) {
            if (fed_ && last_ret_ != 0) {
                throw Error(ErrorKind::IO, "zstd: truncated stream");
            }
            return 0;
        }
        in_ = ZSTD_inBuffer{in_buf_.data(), got, 0};
        fed_ = true;
    }
}

} // namespace rkpi2
