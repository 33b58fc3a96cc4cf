#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Canonical mono 16-bit PCM WAV: 44-byte header then little-endian samples.
constexpr std::size_t kWavHeaderBytes = 44;

struct DecodedWav {
    int sample_rate = 0;
    std::vector<int16_t> samples;
};

// Clamps to [-1, 1]; negatives scale by 32768, the rest by 32767.
int16_t pcm16_from_float(float sample);

std::vector<uint8_t> encode_wav(const std::vector<float>& samples, int sample_rate);

// Accepts mono 16-bit PCM only. Throws WavFormatError on anything else.
DecodedWav decode_wav(const std::vector<uint8_t>& bytes);
