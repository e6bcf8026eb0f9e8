#pragma once

#include <memory>
#include <string>

#include "format/rkpi2_format.hpp"
#include "io/byte_stream.hpp"

namespace rkpi2 {

struct Demuxed {
    std::unique_ptr<ByteSource> stream; // read samples from here only
    Header header;
    bool compressed = false;
};

// Read and check the 2-byte RKPI2 header. If the compressed flag is set the
// source is wrapped in a ZstdSource.
// Throws Error(IO) on a short read or any source failure, Error(StartCode), Error(Format).
Demuxed demux(std::unique_ptr<ByteSource> source);

// True if the file at path starts with a decodable RKPI2 header.
// Only I/O problems opening the file throw.
bool probe(const std::string& path);

} // namespace rkpi2
