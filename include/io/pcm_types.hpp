#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "format/rkpi2_format.hpp"

namespace rkpi2 {

// Interleaved PCM in RKPI2 sample layout: signed integers or IEEE floats,
// host byte order.
struct PcmAudio {
    Header header;
    std::vector<uint8_t> samples;

    size_t frame_bytes() const {
        return static_cast<size_t>(bytes_per_sample(header.format)) * static_cast<size_t>(header.channels);
    }
    size_t frames() const { return frame_bytes() ? samples.size() / frame_bytes() : 0; }
    bool empty() const { return samples.empty(); }
};

} // namespace rkpi2
