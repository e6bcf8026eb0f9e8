#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rkpi2 {

enum class ErrorKind : uint8_t {
    StartCode, // stream does not begin with the RKPI2 start code
    Format,    // sample format code is reserved
    Rate,      // sample rate is not in the rate table
    Channels,  // channel count outside 1..8
    IO,        // read/write/flush failed, or the zstd wrapper could not be set up
};

const char* to_string(ErrorKind k);

// Every failure raised by the codec. kind() is the only thing callers should branch on;
// what() is for humans.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    explicit Error(ErrorKind kind)
        : std::runtime_error(to_string(kind)), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace rkpi2
