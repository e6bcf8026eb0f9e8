#pragma once

#include <string>
#include "io/pcm_types.hpp"

namespace rkpi2 {

// WAVE writer on libsndfile, inverse of load_wav.
// Int64 has no WAV encoding and throws std::runtime_error.
void save_wav(const std::string& path, const PcmAudio& audio);

} // namespace rkpi2
