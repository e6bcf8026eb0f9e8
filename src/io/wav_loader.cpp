#include "io/wav_loader.hpp"

#include "format/rkpi2_error.hpp"

#include <sndfile.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rkpi2 {
namespace {

constexpr sf_count_t kBlockFrames = 4096;

struct SndfileCloser {
    void operator()(SNDFILE* f) const { sf_close(f); }
};
using SndfilePtr = std::unique_ptr<SNDFILE, SndfileCloser>;

static bool is_wave_container(int format) {
    const int major = format & SF_FORMAT_TYPEMASK;
    return major == SF_FORMAT_WAV || major == SF_FORMAT_WAVEX || major == SF_FORMAT_RF64;
}

static SampleFormat to_sample_format(int format, const std::string& path) {
    switch (format & SF_FORMAT_SUBMASK) {
        case SF_FORMAT_PCM_S8:
        case SF_FORMAT_PCM_U8:  return SampleFormat::Int8;
        case SF_FORMAT_PCM_16:  return SampleFormat::Int16;
        case SF_FORMAT_PCM_32:  return SampleFormat::Int32;
        case SF_FORMAT_FLOAT:   return SampleFormat::Float32;
        case SF_FORMAT_DOUBLE:  return SampleFormat::Float64;
        default: break;
    }
    throw std::runtime_error("Unsupported WAV sample encoding (subtype " +
                             std::to_string(format & SF_FORMAT_SUBMASK) + "): " + path);
}

// Read every frame with the typed reader T, appending the host-order bytes.
// Sizes come from what libsndfile actually delivers, never from the header.
template <typename T, typename ReadFn>
static void read_frames(SNDFILE* f, int channels, ReadFn readf, std::vector<uint8_t>& out) {
    std::vector<T> buf(static_cast<size_t>(kBlockFrames) * static_cast<size_t>(channels));
    sf_count_t got = 0;
    while ((got = readf(f, buf.data(), kBlockFrames)) > 0) {
        const size_t bytes = static_cast<size_t>(got) * static_cast<size_t>(channels) * sizeof(T);
        const size_t at = out.size();
        out.resize(at + bytes);
        std::memcpy(out.data() + at, buf.data(), bytes);
    }
}

} // namespace

PcmAudio load_wav(const std::string& path) {
    SF_INFO info{};
    SndfilePtr in(sf_open(path.c_str(), SFM_READ, &info));
    if (!in) {
        throw std::runtime_error("Cannot open WAV file: " + path + " (" + sf_strerror(nullptr) + ")");
    }
    if (!is_wave_container(info.format)) throw std::runtime_error("Not a RIFF/WAVE file: " + path);

    PcmAudio audio;
    audio.header.format = to_sample_format(info.format, path);
    audio.header.rate = static_cast<uint32_t>(info.samplerate);
    audio.header.channels = info.channels;

    uint8_t idx = 0;
    if (info.samplerate <= 0 || !rate_index(audio.header.rate, idx)) {
        throw Error(ErrorKind::Rate, "WAV sample rate " + std::to_string(info.samplerate) +
                                     " Hz has no RKPI2 code: " + path);
    }
    if (info.channels < kMinChannels || info.channels > kMaxChannels) {
        throw Error(ErrorKind::Channels, "WAV has " + std::to_string(info.channels) +
                                         " channels, RKPI2 supports 1..8: " + path);
    }

    switch (audio.header.format) {
        case SampleFormat::Int8: {
            // libsndfile scales 8-bit to the top byte of a short, already signed
            std::vector<uint8_t> wide;
            read_frames<short>(in.get(), info.channels, sf_readf_short, wide);
            audio.samples.reserve(wide.size() / sizeof(short));
            for (size_t i = 0; i + sizeof(short) <= wide.size(); i += sizeof(short)) {
                short s = 0;
                std::memcpy(&s, wide.data() + i, sizeof(short));
                audio.samples.push_back(static_cast<uint8_t>(static_cast<int8_t>(s >> 8)));
            }
            break;
        }
        case SampleFormat::Int16:
            read_frames<short>(in.get(), info.channels, sf_readf_short, audio.samples);
            break;
        case SampleFormat::Int32:
            read_frames<int>(in.get(), info.channels, sf_readf_int, audio.samples);
            break;
        case SampleFormat::Float32:
            read_frames<float>(in.get(), info.channels, sf_readf_float, audio.samples);
            break;
        case SampleFormat::Float64:
            read_frames<double>(in.get(), info.channels, sf_readf_double, audio.samples);
            break;
        case SampleFormat::Int64:
            throw std::runtime_error("WAV cannot carry 64-bit integer PCM: " + path);
    }

    if (sf_error(in.get()) != SF_ERR_NO_ERROR) {
        throw std::runtime_error("WAV read failed: " + path + " (" + sf_strerror(in.get()) + ")");
    }
    return audio;
}

} // namespace rkpi2
