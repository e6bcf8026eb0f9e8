#pragma once

#include <string>
#include "io/pcm_types.hpp"

namespace rkpi2 {

// WAVE reader on libsndfile:
// - WAV, WAVE_FORMAT_EXTENSIBLE and RF64 containers
// - PCM 8/16/32-bit integer, IEEE float 32/64-bit (no 64-bit integer WAV exists)
// - 8-bit (unsigned in WAVE) comes back as signed Int8
// - rate and channel count must be representable in an RKPI2 header
//   (Error(Rate) / Error(Channels)); anything else unreadable throws std::runtime_error
PcmAudio load_wav(const std::string& path);

} // namespace rkpi2
