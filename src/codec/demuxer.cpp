#include "codec/demuxer.hpp"

#include "format/rkpi2_error.hpp"
#include "io/bitstream.hpp"
#include "io/zstd_stream.hpp"

#include <cstdio>
#include <string>

namespace rkpi2 {

Demuxed demux(std::unique_ptr<ByteSource> source) {
    if (!source) throw Error(ErrorKind::IO, "demux: null source");

    HeaderBytes hdr{};
    size_t got = 0;
    try {
        got = source->read_full(hdr.data(), hdr.size());
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw Error(ErrorKind::IO, std::string("demux: header read failed: ") + e.what());
    }
    if (got != hdr.size()) {
        throw Error(ErrorKind::IO, "demux: premature EOF in header (" + std::to_string(got) + " of 2 bytes)");
    }

    Demuxed d;
    d.header = unpack_header(hdr, d.compressed);

#ifndef NDEBUG
    std::fprintf(stderr, "demux: [%02X %02X] -> %s %u Hz x%d%s\n",
                 hdr[0], hdr[1], to_string(d.header.format), d.header.rate,
                 d.header.channels, d.compressed ? " zstd" : "");
#endif

    if (d.compressed) {
        d.stream = std::make_unique<ZstdSource>(std::move(source));
    } else {
        d.stream = std::move(source);
    }
    return d;
}

bool probe(const std::string& path) {
    FileSource src(path);
    HeaderBytes hdr{};
    if (src.read_full(hdr.data(), hdr.size()) != hdr.size()) return false;
    try {
        bool compressed = false;
        unpack_header(hdr, compressed);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::StartCode || e.kind() == ErrorKind::Format) return false;
        throw;
    }
    return true;
}

} // namespace rkpi2
