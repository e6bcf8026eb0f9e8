#include "cli/cli_parser.hpp"
#include "codec/demuxer.hpp"
#include "format/rkpi2_error.hpp"
#include "io/byte_stream.hpp"
#include "io/wav_saver.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

static const char* kUsage =
    "Usage: rkpi2_demux --in <input.rkp> --out <output.wav>\n"
    "       rkpi2_demux --in <input.rkp> --out <output.pcm> --raw\n"
    "       rkpi2_demux --in <input.rkp> --info\n";

static std::vector<uint8_t> read_all(rkpi2::ByteSource& src) {
    std::vector<uint8_t> out;
    std::vector<uint8_t> buf(64 * 1024);
    size_t n = 0;
    while ((n = src.read(buf.data(), buf.size())) > 0) {
        out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return out;
}

int main(int argc, char** argv) {
    try {
        rkpi2::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        const bool info = cli.has("info");
        if (in.empty() || (out.empty() && !info)) {
            std::cout << kUsage;
            return 1;
        }

        auto d = rkpi2::demux(std::make_unique<rkpi2::FileSource>(in));
        std::cout << "format: " << rkpi2::to_string(d.header.format) << "\n"
                  << "rate: " << d.header.rate << " Hz\n"
                  << "channels: " << d.header.channels << "\n"
                  << "compressed: " << (d.compressed ? "zstd" : "no") << "\n";
        if (info) return 0;

        rkpi2::PcmAudio audio;
        audio.header = d.header;
        audio.samples = read_all(*d.stream);

        if (cli.has("raw")) {
            rkpi2::FileSink sink(out);
            sink.write(audio.samples);
            sink.finish();
        } else {
            if (audio.samples.size() % audio.frame_bytes() != 0) {
                throw std::runtime_error("payload is not a whole number of frames");
            }
            rkpi2::save_wav(out, audio);
        }
        std::cout << "Wrote: " << out << " (" << audio.frames() << " frames)\n";
        return 0;
    } catch (const rkpi2::Error& e) {
        std::cerr << "[ERROR] " << rkpi2::to_string(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
