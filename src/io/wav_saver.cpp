#include "io/wav_saver.hpp"

#include <sndfile.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>

namespace rkpi2 {
namespace {

struct SndfileCloser {
    void operator()(SNDFILE* f) const { sf_close(f); }
};

template <typename T, typename WriteFn>
static void write_frames(SNDFILE* f, const PcmAudio& audio, WriteFn writef, const std::string& path) {
    std::vector<T> buf(audio.samples.size() / sizeof(T));
    if (!buf.empty()) std::memcpy(buf.data(), audio.samples.data(), buf.size() * sizeof(T));
    const sf_count_t frames = static_cast<sf_count_t>(audio.frames());
    if (writef(f, buf.data(), frames) != frames) {
        throw std::runtime_error("WAV write failed: " + path + " (" + sf_strerror(f) + ")");
    }
}

} // namespace

void save_wav(const std::string& path, const PcmAudio& audio) {
    const Header& h = audio.header;
    if (!header_valid(h)) throw std::runtime_error("Invalid header for WAV output");
    if (audio.samples.size() % audio.frame_bytes() != 0) throw std::runtime_error("sample buffer is not whole frames");

    SF_INFO info{};
    info.samplerate = static_cast<int>(h.rate);
    info.channels = h.channels;
    switch (h.format) {
        case SampleFormat::Int8:    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_U8; break;
        case SampleFormat::Int16:   info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16; break;
        case SampleFormat::Int32:   info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_32; break;
        case SampleFormat::Float32: info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT; break;
        case SampleFormat::Float64: info.format = SF_FORMAT_WAV | SF_FORMAT_DOUBLE; break;
        case SampleFormat::Int64:
            throw std::runtime_error("WAV cannot carry 64-bit integer PCM: " + path);
    }
    if (!sf_format_check(&info)) throw std::runtime_error("libsndfile rejected WAV format for: " + path);

    std::unique_ptr<SNDFILE, SndfileCloser> out(sf_open(path.c_str(), SFM_WRITE, &info));
    if (!out) {
        throw std::runtime_error("Cannot write file: " + path + " (" + sf_strerror(nullptr) + ")");
    }

    switch (h.format) {
        case SampleFormat::Int8: {
            // Widen to the top byte of a short; libsndfile stores it unsigned
            std::vector<short> wide(audio.samples.size());
            for (size_t i = 0; i < wide.size(); ++i) {
                wide[i] = static_cast<short>(static_cast<int8_t>(audio.samples[i]) * 256);
            }
            const sf_count_t frames = static_cast<sf_count_t>(audio.frames());
            if (sf_writef_short(out.get(), wide.data(), frames) != frames) {
                throw std::runtime_error("WAV write failed: " + path + " (" + sf_strerror(out.get()) + ")");
            }
            break;
        }
        case SampleFormat::Int16:
            write_frames<short>(out.get(), audio, sf_writef_short, path);
            break;
        case SampleFormat::Int32:
            write_frames<int>(out.get(), audio, sf_writef_int, path);
            break;
        case SampleFormat::Float32:
            write_frames<float>(out.get(), audio, sf_writef_float, path);
            break;
        case SampleFormat::Float64:
            write_frames<double>(out.get(), audio, sf_writef_double, path);
            break;
        case SampleFormat::Int64:
            break; // rejected above
    }
}

} // namespace rkpi2
