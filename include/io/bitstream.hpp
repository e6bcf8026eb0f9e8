#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "format/rkpi2_format.hpp"

namespace rkpi2 {

using HeaderBytes = std::array<uint8_t, kHeaderBytes>;

// Validate and pack a header. Throws Error(Rate) before Error(Channels).
HeaderBytes pack_header(const Header& h, bool compressed);

// Unpack a header. Throws Error(StartCode) before looking at any other field,
// then Error(Format) for a reserved format code. Rate and channels cannot fail.
Header unpack_header(const HeaderBytes& bytes, bool& compressed);

bool has_start_code(uint8_t byte0);

// Little-endian field helpers for the RIFF side of the tools.
inline void put_u16_le(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}
inline void put_u32_le(std::vector<uint8_t>& b, uint32_t v) {
    put_u16_le(b, static_cast<uint16_t>(v & 0xFFFF));
    put_u16_le(b, static_cast<uint16_t>((v >> 16) & 0xFFFF));
}
inline uint16_t get_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}
inline uint32_t get_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0] |
                                 (static_cast<uint32_t>(p[1]) << 8) |
                                 (static_cast<uint32_t>(p[2]) << 16) |
                                 (static_cast<uint32_t>(p[3]) << 24));
}

} // namespace rkpi2
