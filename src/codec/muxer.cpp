#include "codec/muxer.hpp"

#include "format/rkpi2_error.hpp"
#include "io/bitstream.hpp"
#include "io/zstd_stream.hpp"

#include <cstdio>
#include <string>

namespace rkpi2 {

std::unique_ptr<ByteSink> mux(std::unique_ptr<ByteSink> sink,
                              const Header& header,
                              const std::optional<int>& level) {
    if (!sink) throw Error(ErrorKind::IO, "mux: null sink");

    const bool compressed = level.has_value();
    // Rate and channels are reported before anything about the level.
    const HeaderBytes hdr = pack_header(header, compressed);
    if (compressed && (*level < kMinLevel || *level > kMaxLevel)) {
        throw Error(ErrorKind::IO, "mux: compression level " + std::to_string(*level) + " not in 1..21");
    }

#ifndef NDEBUG
    std::fprintf(stderr, "mux: %s %u Hz x%d%s -> [%02X %02X]\n",
                 to_string(header.format), header.rate, header.channels,
                 compressed ? " zstd" : "", hdr[0], hdr[1]);
#endif

    try {
        sink->write(hdr.data(), hdr.size());
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw Error(ErrorKind::IO, std::string("mux: header write failed: ") + e.what());
    }

    if (!compressed) return sink;
    return std::make_unique<ZstdSink>(std::move(sink), *level);
}

} // namespace rkpi2
