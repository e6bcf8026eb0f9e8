#include "format/rkpi2_format.hpp"
#include "format/rkpi2_error.hpp"

#include <string>

namespace rkpi2 {

uint8_t format_code(SampleFormat f) {
    switch (f) {
        case SampleFormat::Int8:    return 0;
        case SampleFormat::Int16:   return 1;
        case SampleFormat::Int32:   return 2;
        case SampleFormat::Int64:   return 3;
        case SampleFormat::Float32: return 4;
        case SampleFormat::Float64: return 5;
    }
    throw Error(ErrorKind::Format, "format_code: unknown sample format");
}

SampleFormat format_from_code(uint8_t code) {
    switch (code) {
        case 0: return SampleFormat::Int8;
        case 1: return SampleFormat::Int16;
        case 2: return SampleFormat::Int32;
        case 3: return SampleFormat::Int64;
        case 4: return SampleFormat::Float32;
        case 5: return SampleFormat::Float64;
        default:
            throw Error(ErrorKind::Format,
                        "format: reserved sample format code " + std::to_string(code));
    }
}

bool rate_index(uint32_t rate, uint8_t& index) {
    for (size_t i = 0; i < kSampleRates.size(); ++i) {
        if (kSampleRates[i] == rate) {
            index = static_cast<uint8_t>(i);
            return true;
        }
    }
    return false;
}

uint32_t rate_from_index(uint8_t index) {
    return kSampleRates[index & 0x07u];
}

int bytes_per_sample(SampleFormat f) {
    switch (f) {
        case SampleFormat::Int8:    return 1;
        case SampleFormat::Int16:   return 2;
        case SampleFormat::Int32:   return 4;
        case SampleFormat::Int64:   return 8;
        case SampleFormat::Float32: return 4;
        case SampleFormat::Float64: return 8;
    }
    return 0;
}

bool is_float(SampleFormat f) {
    return f == SampleFormat::Float32 || f == SampleFormat::Float64;
}

const char* to_string(SampleFormat f) {
    switch (f) {
        case SampleFormat::Int8:    return "int8";
        case SampleFormat::Int16:   return "int16";
        case SampleFormat::Int32:   return "int32";
        case SampleFormat::Int64:   return "int64";
        case SampleFormat::Float32: return "float32";
        case SampleFormat::Float64: return "float64";
    }
    return "unknown";
}

bool sample_format_from_string(const std::string& name, SampleFormat& out) {
    for (uint8_t code = 0; code < 6; ++code) {
        const SampleFormat f = format_from_code(code);
        if (name == to_string(f)) {
            out = f;
            return true;
        }
    }
    return false;
}

bool header_valid(const Header& h) {
    uint8_t idx = 0;
    return rate_index(h.rate, idx) && h.channels >= kMinChannels && h.channels <= kMaxChannels;
}

#ifndef NDEBUG
namespace {
// Self-test: every wire code and rate index must map back to itself.
struct FormatTableSelfTest {
    FormatTableSelfTest() {
        for (uint8_t code = 0; code < 6; ++code) {
            if (format_code(format_from_code(code)) != code) {
                throw std::runtime_error("format self-test: code mismatch");
            }
        }
        for (uint8_t i = 0; i < kSampleRates.size(); ++i) {
            uint8_t back = 0xFF;
            if (!rate_index(rate_from_index(i), back) || back != i) {
                throw std::runtime_error("format self-test: rate index mismatch");
            }
        }
    }
};
static FormatTableSelfTest _format_self_test{};
} // namespace
#endif

} // namespace rkpi2
