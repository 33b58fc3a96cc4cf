#include "wav_encoder.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

uint16_t ReadU16(const std::vector<uint8_t>& b, std::size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

uint32_t ReadU32(const std::vector<uint8_t>& b, std::size_t off) {
    return static_cast<uint32_t>(b[off]) | (static_cast<uint32_t>(b[off + 1]) << 8) |
           (static_cast<uint32_t>(b[off + 2]) << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
}

std::string ReadTag(const std::vector<uint8_t>& b, std::size_t off) {
    return std::string(b.begin() + off, b.begin() + off + 4);
}

void PutU32(std::vector<uint8_t>& b, std::size_t off, uint32_t v) {
    for (int i = 0; i < 4; ++i) b[off + i] = static_cast<uint8_t>(v >> (8 * i));
}

} // namespace

TEST(WavEncoder, HeaderFieldsMatchInputs) {
    std::vector<float> samples = {0.0f, 0.25f, -0.25f, 1.0f, -1.0f};
    std::vector<uint8_t> wav = encode_wav(samples, 22050);

    ASSERT_EQ(wav.size(), 44u + samples.size() * 2);
    EXPECT_EQ(ReadTag(wav, 0), "RIFF");
    EXPECT_EQ(ReadU32(wav, 4), wav.size() - 8);
    EXPECT_EQ(ReadTag(wav, 8), "WAVE");
    EXPECT_EQ(ReadTag(wav, 12), "fmt ");
    EXPECT_EQ(ReadU32(wav, 16), 16u);
    EXPECT_EQ(ReadU16(wav, 20), 1u);
    EXPECT_EQ(ReadU16(wav, 22), 1u);
    EXPECT_EQ(ReadU32(wav, 24), 22050u);
    EXPECT_EQ(ReadU32(wav, 28), 44100u);
    EXPECT_EQ(ReadU16(wav, 32), 2u);
    EXPECT_EQ(ReadU16(wav, 34), 16u);
    EXPECT_EQ(ReadTag(wav, 36), "data");
    EXPECT_EQ(ReadU32(wav, 40), samples.size() * 2);
}

TEST(WavEncoder, PayloadReconstructsWithinOneStep) {
    std::vector<float> samples;
    for (int i = 0; i < 480; ++i) {
        samples.push_back(0.8f * static_cast<float>(std::sin(2.0 * kPi * 440.0 * i / 48000.0)));
    }
    std::vector<uint8_t> wav = encode_wav(samples, 48000);

    for (std::size_t i = 0; i < samples.size(); ++i) {
        int16_t q = static_cast<int16_t>(ReadU16(wav, 44 + 2 * i));
        double back = q < 0 ? q / 32768.0 : q / 32767.0;
        ASSERT_NEAR(back, samples[i], 1.0 / 32768.0) << "sample " << i;
    }
}

TEST(WavEncoder, QuantizationIsAsymmetricAndClamped) {
    EXPECT_EQ(pcm16_from_float(0.0f), 0);
    EXPECT_EQ(pcm16_from_float(1.0f), 32767);
    EXPECT_EQ(pcm16_from_float(-1.0f), -32768);
    EXPECT_EQ(pcm16_from_float(0.5f), 16384);
    EXPECT_EQ(pcm16_from_float(-0.5f), -16384);
    EXPECT_EQ(pcm16_from_float(1.7f), 32767);
    EXPECT_EQ(pcm16_from_float(-3.0f), -32768);
    EXPECT_EQ(pcm16_from_float(std::numeric_limits<float>::infinity()), 32767);
    EXPECT_EQ(pcm16_from_float(std::numeric_limits<float>::quiet_NaN()), 0);
}

TEST(WavEncoder, EmptyInputIsHeaderOnly) {
    std::vector<uint8_t> wav = encode_wav({}, 16000);
    ASSERT_EQ(wav.size(), 44u);
    EXPECT_EQ(ReadU32(wav, 4), 36u);
    EXPECT_EQ(ReadU32(wav, 40), 0u);

    DecodedWav decoded = decode_wav(wav);
    EXPECT_EQ(decoded.sample_rate, 16000);
    EXPECT_TRUE(decoded.samples.empty());
}

TEST(WavEncoder, RejectsNonPositiveRate) {
    EXPECT_THROW(encode_wav({0.1f}, 0), InvalidConfiguration);
    EXPECT_THROW(encode_wav({0.1f}, -44100), InvalidConfiguration);
}

TEST(WavEncoder, ExportOfHalfScaleSecond) {
    std::vector<uint8_t> wav = encode_wav(std::vector<float>(16000, 0.5f), 16000);
    ASSERT_EQ(wav.size(), 32044u);
    for (std::size_t off = 44; off < wav.size(); off += 2) {
        ASSERT_EQ(static_cast<int16_t>(ReadU16(wav, off)), 16384) << "offset " << off;
    }
}

TEST(WavDecoder, ReadsBackEncodedPayload) {
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 2.0f, -2.0f, 0.001f};
    DecodedWav decoded = decode_wav(encode_wav(samples, 8000));

    EXPECT_EQ(decoded.sample_rate, 8000);
    ASSERT_EQ(decoded.samples.size(), samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        EXPECT_EQ(decoded.samples[i], pcm16_from_float(samples[i]));
    }
}

TEST(WavDecoder, SkipsUnknownChunks) {
    std::vector<uint8_t> wav = encode_wav({0.25f, -0.25f}, 16000);

    // Splice an odd-sized LIST chunk (plus pad byte) between fmt and data.
    std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
    wav.insert(wav.begin() + 36, list.begin(), list.end());
    PutU32(wav, 4, static_cast<uint32_t>(wav.size() - 8));

    DecodedWav decoded = decode_wav(wav);
    EXPECT_EQ(decoded.sample_rate, 16000);
    EXPECT_EQ(decoded.samples, (std::vector<int16_t>{8192, -8192}));
}

TEST(WavDecoder, TruncatedDataKeepsWholeSamples) {
    std::vector<uint8_t> wav = encode_wav({0.1f, 0.2f, 0.3f}, 16000);
    wav.resize(wav.size() - 1);

    DecodedWav decoded = decode_wav(wav);
    EXPECT_EQ(decoded.samples.size(), 2u);
}

TEST(WavDecoder, RejectsMalformedInput) {
    const std::vector<uint8_t> good = encode_wav({0.1f}, 16000);

    EXPECT_THROW(decode_wav({}), WavFormatError);
    EXPECT_THROW(decode_wav(std::vector<uint8_t>(good.begin(), good.begin() + 8)), WavFormatError);

    std::vector<uint8_t> bad = good;
    bad[0] = 'X';
    EXPECT_THROW(decode_wav(bad), WavFormatError);

    bad = good;
    bad[20] = 3; // IEEE float
    EXPECT_THROW(decode_wav(bad), WavFormatError);

    bad = good;
    bad[22] = 2; // stereo
    EXPECT_THROW(decode_wav(bad), WavFormatError);

    bad = good;
    bad[34] = 8;
    EXPECT_THROW(decode_wav(bad), WavFormatError);

    bad = good;
    PutU32(bad, 24, 0);
    EXPECT_THROW(decode_wav(bad), WavFormatError);

    // Header without a data chunk.
    EXPECT_THROW(decode_wav(std::vector<uint8_t>(good.begin(), good.begin() + 36)), WavFormatError);
}
