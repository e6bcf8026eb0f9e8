#include "format/rkpi2_error.hpp"
#include "io/bitstream.hpp"

#include <gtest/gtest.h>

using namespace rkpi2;

namespace {

ErrorKind pack_error(const Header& h) {
    try {
        pack_header(h, false);
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "pack_header accepted an invalid header";
    return ErrorKind::IO;
}

ErrorKind unpack_error(uint8_t b0, uint8_t b1) {
    bool compressed = false;
    try {
        unpack_header(HeaderBytes{b0, b1}, compressed);
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "unpack_header accepted invalid bytes";
    return ErrorKind::IO;
}

}  // namespace

TEST(PackHeader, MinimalHeaderLiteral) {
    const HeaderBytes b = pack_header(Header{SampleFormat::Int8, 8000, 1}, false);
    EXPECT_EQ(b[0], 0xF4);
    EXPECT_EQ(b[1], 0x00);
}

TEST(PackHeader, CompressionFlagIsBit1) {
    const HeaderBytes b = pack_header(Header{SampleFormat::Int8, 8000, 1}, true);
    EXPECT_EQ(b[0], 0xF6);
    EXPECT_EQ(b[1], 0x00);
}

TEST(PackHeader, FormatCodeSplitsAcrossBytes) {
    // Float64 = 0b101: bit 2 lands in byte0 bit 0, bits 1..0 in byte1 bits 7..6
    const HeaderBytes b = pack_header(Header{SampleFormat::Float64, 8000, 1}, false);
    EXPECT_EQ(b[0], 0xF5);
    EXPECT_EQ(b[1], 0x40);
}

TEST(PackHeader, RateAndChannelsFields) {
    // 44100 -> index 4, 8 channels -> 7
    const HeaderBytes b = pack_header(Header{SampleFormat::Int16, 44100, 8}, false);
    EXPECT_EQ(b[0], 0xF4);
    EXPECT_EQ(b[1], (1 << 6) | (4 << 3) | 7);
}

TEST(PackHeader, RejectsRateOutsideTable) {
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 50000, 2}), ErrorKind::Rate);
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 48000, 2}), ErrorKind::Rate);
}

TEST(PackHeader, RejectsChannelsOutsideRange) {
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 44100, 0}), ErrorKind::Channels);
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 44100, 9}), ErrorKind::Channels);
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 44100, -1}), ErrorKind::Channels);
}

TEST(PackHeader, RateIsCheckedBeforeChannels) {
    EXPECT_EQ(pack_error(Header{SampleFormat::Int16, 50000, 0}), ErrorKind::Rate);
}

TEST(UnpackHeader, MinimalHeaderLiteral) {
    bool compressed = true;
    const Header h = unpack_header(HeaderBytes{0xF4, 0x00}, compressed);
    EXPECT_EQ(h, (Header{SampleFormat::Int8, 8000, 1}));
    EXPECT_FALSE(compressed);
}

TEST(UnpackHeader, ReadsEveryField) {
    bool compressed = false;
    // compressed, Float32 (0b100), 192000 (7), 6 channels
    const Header h = unpack_header(HeaderBytes{0xF7, (0 << 6) | (7 << 3) | 5}, compressed);
    EXPECT_EQ(h.format, SampleFormat::Float32);
    EXPECT_EQ(h.rate, 192000u);
    EXPECT_EQ(h.channels, 6);
    EXPECT_TRUE(compressed);
}

TEST(UnpackHeader, RejectsWrongStartCode) {
    EXPECT_EQ(unpack_error(0x00, 0x00), ErrorKind::StartCode);
    EXPECT_EQ(unpack_error(0xF0, 0x00), ErrorKind::StartCode); // 0b111100
    EXPECT_EQ(unpack_error(0xFC, 0x00), ErrorKind::StartCode); // 0b111111
    EXPECT_EQ(unpack_error('R', 'I'), ErrorKind::StartCode);
}

TEST(UnpackHeader, StartCodeIsCheckedBeforeFormat) {
    // format bits say 7, but the start code is wrong
    EXPECT_EQ(unpack_error(0x01, 0xC0), ErrorKind::StartCode);
}

TEST(UnpackHeader, RejectsReservedFormats) {
    EXPECT_EQ(unpack_error(0xF5, 0x80), ErrorKind::Format); // 0b110
    EXPECT_EQ(unpack_error(0xF5, 0xC0), ErrorKind::Format); // 0b111
    EXPECT_EQ(unpack_error(0xF7, 0xFF), ErrorKind::Format);
}

TEST(UnpackHeader, InvertsPackForEveryValidHeader) {
    for (uint8_t code = 0; code < 6; ++code) {
        for (uint32_t rate : kSampleRates) {
            for (int ch = kMinChannels; ch <= kMaxChannels; ++ch) {
                for (bool flag : {false, true}) {
                    const Header in{format_from_code(code), rate, ch};
                    bool compressed = !flag;
                    const Header out = unpack_header(pack_header(in, flag), compressed);
                    EXPECT_EQ(out, in);
                    EXPECT_EQ(compressed, flag);
                }
            }
        }
    }
}

TEST(StartCode, Probe) {
    EXPECT_TRUE(has_start_code(0xF4));
    EXPECT_TRUE(has_start_code(0xF7));
    EXPECT_FALSE(has_start_code(0xF8));
}

TEST(LittleEndian, PutAndGet) {
    std::vector<uint8_t> b;
    put_u16_le(b, 0x1234);
    put_u32_le(b, 0xA1B2C3D4u);
    ASSERT_EQ(b.size(), 6u);
    EXPECT_EQ(b[0], 0x34);
    EXPECT_EQ(b[2], 0xD4);
    EXPECT_EQ(get_u16_le(&b[0]), 0x1234);
    EXPECT_EQ(get_u32_le(&b[2]), 0xA1B2C3D4u);
}
