#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rkpi2 {

// Sequential byte output. Implementations throw Error(ErrorKind::IO) on failure.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(const uint8_t* data, size_t n) = 0;
    virtual void flush() = 0;
    // Flush and finalize any framing. Nothing may be written afterwards.
    virtual void finish() { flush(); }

    void write(const std::vector<uint8_t>& bytes) { write(bytes.data(), bytes.size()); }
};

// Sequential byte input. read() returns 0 only at end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual size_t read(uint8_t* out, size_t n) = 0;

    // Loop until n bytes or end of stream. Returns the number of bytes read.
    size_t read_full(uint8_t* out, size_t n);
};

// Appends to a caller-owned buffer, which must outlive the sink.
class VectorSink : public ByteSink {
public:
    explicit VectorSink(std::vector<uint8_t>& out) : buf_(out) {}

    void write(const uint8_t* data, size_t n) override;
    void flush() override {}
    using ByteSink::write;

private:
    std::vector<uint8_t>& buf_;
};

class VectorSource : public ByteSource {
public:
    explicit VectorSource(std::vector<uint8_t> data) : buf_(std::move(data)) {}

    size_t read(uint8_t* out, size_t n) override;
    size_t remaining() const { return buf_.size() - pos_; }

private:
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

class FileSink : public ByteSink {
public:
    explicit FileSink(const std::string& path);

    void write(const uint8_t* data, size_t n) override;
    void flush() override;
    using ByteSink::write;

private:
    std::string path_;
    std::ofstream ofs_;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);

    size_t read(uint8_t* out, size_t n) override;

private:
    std::string path_;
    std::ifstream ifs_;
};

} // namespace rkpi2
