#include "cli/cli_parser.hpp"
#include "codec/muxer.hpp"
#include "format/rkpi2_error.hpp"
#include "io/byte_stream.hpp"
#include "io/wav_loader.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <iostream>
#include <optional>
#include <vector>

static const char* kUsage =
    "Usage: rkpi2_mux --in <input.wav> --out <output.rkp> [--level <1..21>]\n"
    "       rkpi2_mux --raw --in <input.pcm> --format <int8|int16|int32|int64|float32|float64>\n"
    "                 --rate <hz> --channels <1..8> --out <output.rkp> [--level <1..21>]\n";

// Copy a headerless PCM file through the muxed sink without loading it whole.
static uint64_t copy_raw(const std::string& in, rkpi2::ByteSink& out) {
    rkpi2::FileSource src(in);
    std::vector<uint8_t> buf(64 * 1024);
    uint64_t total = 0;
    size_t n = 0;
    while ((n = src.read(buf.data(), buf.size())) > 0) {
        out.write(buf.data(), n);
        total += n;
    }
    return total;
}

int main(int argc, char** argv) {
    try {
        rkpi2::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cout << kUsage;
            return 1;
        }

        std::optional<int> level;
        if (cli.has("level")) {
            level = static_cast<int>(cli.get_int("level", rkpi2::kMinLevel, rkpi2::kMaxLevel));
        }

        rkpi2::Header hdr;
        rkpi2::PcmAudio audio;
        const bool raw = cli.has("raw");
        if (raw) {
            if (!cli.has("format") || !cli.has("rate") || !cli.has("channels")) {
                std::cout << kUsage;
                return 1;
            }
            if (!rkpi2::sample_format_from_string(cli.get("format"), hdr.format)) {
                std::cout << "Unknown --format '" << cli.get("format") << "'\n" << kUsage;
                return 1;
            }
            hdr.rate = static_cast<uint32_t>(cli.get_int("rate", 1, 0xFFFFFFFFL));
            hdr.channels = static_cast<int>(cli.get_int("channels", 0, 255));
        } else {
            audio = rkpi2::load_wav(in);
            hdr = audio.header;
        }

        auto stream = rkpi2::mux(std::make_unique<rkpi2::FileSink>(out), hdr, level);
        uint64_t payload = 0;
        if (raw) {
            payload = copy_raw(in, *stream);
        } else {
            stream->write(audio.samples);
            payload = audio.samples.size();
        }
        stream->finish();
        stream.reset();

        std::cout << "Header: " << rkpi2::to_string(hdr.format) << ", " << hdr.rate << " Hz, "
                  << hdr.channels << " ch" << (level ? ", zstd level " + std::to_string(*level) : "") << "\n";
        std::cout << "input payload: " << payload << " bytes\n";
        std::cout << "Wrote: " << out << " (" << std::filesystem::file_size(out) << " bytes)\n";
        return 0;
    } catch (const rkpi2::Error& e) {
        std::cerr << "[ERROR] " << rkpi2::to_string(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
