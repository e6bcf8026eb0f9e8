#include "io/bitstream.hpp"
#include "format/rkpi2_error.hpp"

#include <string>

namespace rkpi2 {

HeaderBytes pack_header(const Header& h, bool compressed) {
    uint8_t srate_idx = 0;
    if (!rate_index(h.rate, srate_idx)) {
        throw Error(ErrorKind::Rate, "mux: sample rate " + std::to_string(h.rate) + " Hz is not allowed");
    }
    if (h.channels < kMinChannels || h.channels > kMaxChannels) {
        throw Error(ErrorKind::Channels, "mux: channel count " + std::to_string(h.channels) + " not in 1..8");
    }

    const uint8_t fmt = format_code(h.format);
    const uint8_t ch = static_cast<uint8_t>(h.channels - 1);

    HeaderBytes out{};
    out[0] = static_cast<uint8_t>((kStartCode << 2) |
                                  ((compressed ? 1u : 0u) << 1) |
                                  (fmt >> 2));
    out[1] = static_cast<uint8_t>(((fmt & 0x03u) << 6) |
                                  (srate_idx << 3) |
                                  ch);
    return out;
}

Header unpack_header(const HeaderBytes& bytes, bool& compressed) {
    if (!has_start_code(bytes[0])) {
        throw Error(ErrorKind::StartCode, "demux: bad start code (not an RKPI2 stream)");
    }

    const uint8_t fmt = static_cast<uint8_t>(((bytes[0] & 0x01u) << 2) | (bytes[1] >> 6));

    Header h;
    h.format = format_from_code(fmt);
    h.rate = rate_from_index(static_cast<uint8_t>((bytes[1] >> 3) & 0x07u));
    h.channels = static_cast<int>(bytes[1] & 0x07u) + 1;
    compressed = ((bytes[0] >> 1) & 0x01u) != 0;
    return h;
}

bool has_start_code(uint8_t byte0) {
    return (byte0 >> 2) == kStartCode;
}

} // namespace rkpi2
