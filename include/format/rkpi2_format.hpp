#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rkpi2 {

// .rkp stream layout:
// [Header (2 bytes)][payload...]
//
// byte0: SSSSSSCF   S = start code 0x3D, C = compressed, F = format bit 2
// byte1: FFRRRNNN   F = format bits 1..0, R = rate index, N = channels - 1
//
// Payload is interleaved PCM, raw or one zstd stream. No length, no trailer.
inline constexpr uint8_t kStartCode = 0x3D;
inline constexpr size_t kHeaderBytes = 2;

inline constexpr int kMinChannels = 1;
inline constexpr int kMaxChannels = 8;

// zstd levels accepted for a compressed payload
inline constexpr int kMinLevel = 1;
inline constexpr int kMaxLevel = 21;

// Position in this table is the wire value, not the rate itself.
inline constexpr std::array<uint32_t, 8> kSampleRates = {
    8000, 12000, 22050, 32000, 44100, 64000, 96000, 192000,
};

// Int* are signed integers, Float* are IEEE floats.
enum class SampleFormat : uint8_t {
    Int8,
    Int16,
    Int32,
    Int64,
    Float32,
    Float64,
};

struct Header {
    SampleFormat format = SampleFormat::Int16;
    uint32_t rate = 44100;  // Hz, one of kSampleRates
    int channels = 2;       // interleaved, 1..8

    bool operator==(const Header& o) const {
        return format == o.format && rate == o.rate && channels == o.channels;
    }
    bool operator!=(const Header& o) const { return !(*this == o); }
};

// 3-bit wire code. Kept explicit so reordering the enum cannot move the wire value.
uint8_t format_code(SampleFormat f);
// Throws Error(ErrorKind::Format) for reserved codes (6, 7).
SampleFormat format_from_code(uint8_t code);

// Returns false if rate is not in kSampleRates.
bool rate_index(uint32_t rate, uint8_t& index);
// Only the low 3 bits of index are used.
uint32_t rate_from_index(uint8_t index);

int bytes_per_sample(SampleFormat f);
bool is_float(SampleFormat f);
const char* to_string(SampleFormat f);
// Accepts the names produced by to_string(SampleFormat).
bool sample_format_from_string(const std::string& name, SampleFormat& out);

bool header_valid(const Header& h);

} // namespace rkpi2
