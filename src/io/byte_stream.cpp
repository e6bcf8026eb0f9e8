#include "io/byte_stream.hpp"
#include "format/rkpi2_error.hpp"

#include <algorithm>
#include <cstring>

namespace rkpi2 {

size_t ByteSource::read_full(uint8_t* out, size_t n) {
    size_t done = 0;
    while (done < n) {
        size_t r = read(out + done, n - done);
        if (r == 0) break; // EOF
        done += r;
    }
    return done;
}

void VectorSink::write(const uint8_t* data, size_t n) {
    if (!data && n != 0) throw Error(ErrorKind::IO, "VectorSink: write null data");
    buf_.insert(buf_.end(), data, data + n);
}

size_t VectorSource::read(uint8_t* out, size_t n) {
    if (!out && n != 0) throw Error(ErrorKind::IO, "VectorSource: read into null buffer");
    const size_t take = std::min(n, remaining());
    if (take != 0) {
        std::memcpy(out, buf_.data() + pos_, take);
        pos_ += take;
    }
    return take;
}

FileSink::FileSink(const std::string& path)
    : path_(path), ofs_(path, std::ios::binary | std::ios::trunc) {
    if (!ofs_.good()) throw Error(ErrorKind::IO, "Cannot write file: " + path);
}

void FileSink::write(const uint8_t* data, size_t n) {
    if (n == 0) return;
    ofs_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!ofs_.good()) throw Error(ErrorKind::IO, "write failed: " + path_);
}

void FileSink::flush() {
    ofs_.flush();
    if (!ofs_.good()) throw Error(ErrorKind::IO, "flush failed: " + path_);
}

FileSource::FileSource(const std::string& path)
    : path_(path), ifs_(path, std::ios::binary) {
    if (!ifs_.good()) throw Error(ErrorKind::IO, "Cannot open file: " + path);
}

size_t FileSource::read(uint8_t* out, size_t n) {
    if (n == 0 || ifs_.eof()) return 0;
    ifs_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
    if (ifs_.bad()) throw Error(ErrorKind::IO, "read failed: " + path_);
    return static_cast<size_t>(ifs_.gcount());
}

} // namespace rkpi2
