#include "codec/demuxer.hpp"
#include "codec/muxer.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <gtest/gtest.h>
#include <random>

using namespace rkpi2;

namespace {

std::vector<uint8_t> random_bytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> v(n);
    for (auto& b : v) b = static_cast<uint8_t>(dist(rng));
    return v;
}

std::vector<uint8_t> read_all(ByteSource& src) {
    std::vector<uint8_t> out;
    uint8_t buf[4096];
    size_t n = 0;
    while ((n = src.read(buf, sizeof(buf))) > 0) out.insert(out.end(), buf, buf + n);
    return out;
}

}  // namespace

// Header only: the zstd contexts are never asked to compress, so level 21 stays cheap.
TEST(RoundTrip, EveryValidHeaderAtEveryLevel) {
    const std::optional<int> levels[] = {std::nullopt, 1, 21};
    for (uint8_t code = 0; code < 6; ++code) {
        for (uint32_t rate : kSampleRates) {
            for (int ch = kMinChannels; ch <= kMaxChannels; ++ch) {
                for (const auto& level : levels) {
                    const Header in{format_from_code(code), rate, ch};
                    std::vector<uint8_t> out;
                    auto stream = mux(std::make_unique<VectorSink>(out), in, level);
                    stream.reset();

                    auto d = demux(std::make_unique<VectorSource>(out));
                    EXPECT_EQ(d.header, in);
                    EXPECT_EQ(d.compressed, level.has_value());
                }
            }
        }
    }
}

TEST(RoundTrip, SamplesUncompressed) {
    const Header h{SampleFormat::Int8, 8000, 1};
    const auto samples = random_bytes(h.rate * static_cast<size_t>(h.channels), 1);

    std::vector<uint8_t> out;
    auto w = mux(std::make_unique<VectorSink>(out), h);
    w->write(samples);
    w->finish();
    EXPECT_EQ(out.size(), samples.size() + kHeaderBytes);

    auto d = demux(std::make_unique<VectorSource>(out));
    EXPECT_EQ(d.header, h);
    EXPECT_EQ(read_all(*d.stream), samples);
}

TEST(RoundTrip, SamplesCompressed) {
    const Header h{SampleFormat::Int16, 12000, 2};
    // 127-filled like a silent-ish signal, plus a random tail so both paths are exercised
    std::vector<uint8_t> samples(h.rate * static_cast<size_t>(h.channels), 127);
    const auto noise = random_bytes(4000, 2);
    std::copy(noise.begin(), noise.end(), samples.end() - static_cast<std::ptrdiff_t>(noise.size()));

    for (int level : {1, 3}) {
        std::vector<uint8_t> out;
        auto w = mux(std::make_unique<VectorSink>(out), h, level);
        w->write(samples);
        w->finish();
        EXPECT_LT(out.size(), samples.size());

        auto d = demux(std::make_unique<VectorSource>(out));
        EXPECT_EQ(d.header, h);
        EXPECT_TRUE(d.compressed);
        EXPECT_EQ(read_all(*d.stream), samples);
    }
}

TEST(RoundTrip, FlushedButUnfinishedStreamReadsBack) {
    const Header h{SampleFormat::Int8, 8000, 1};
    const std::vector<uint8_t> samples(h.rate * static_cast<size_t>(h.channels), 127);

    std::vector<uint8_t> out;
    auto w = mux(std::make_unique<VectorSink>(out), h, 1);
    w->write(samples);
    w->flush();

    auto d = demux(std::make_unique<VectorSource>(out));
    std::vector<uint8_t> back(samples.size());
    EXPECT_EQ(d.stream->read_full(back.data(), back.size()), samples.size());
    EXPECT_EQ(back, samples);
}

TEST(RoundTrip, ThroughFiles) {
    const auto path = (std::filesystem::temp_directory_path() / "rkpi2_roundtrip_files.rkp").string();
    const Header h{SampleFormat::Float32, 44100, 2};
    const auto samples = random_bytes(44100 * 2 * 4 / 10, 3);

    {
        auto w = mux(std::make_unique<FileSink>(path), h, 2);
        w->write(samples);
        w->finish();
    }
    ASSERT_TRUE(probe(path));

    auto d = demux(std::make_unique<FileSource>(path));
    EXPECT_EQ(d.header, h);
    EXPECT_EQ(read_all(*d.stream), samples);
    std::filesystem::remove(path);
}
