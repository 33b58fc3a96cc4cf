#include "wav_encoder.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kChannels = 1;
constexpr uint16_t kBitsPerSample = 16;
constexpr uint16_t kBlockAlign = kChannels * kBitsPerSample / 8;
constexpr uint32_t kFmtChunkBytes = 16;

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xff));
    }
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

int16_t pcm16_from_float(float sample) {
    // NaN clamps to silence.
    if (std::isnan(sample)) return 0;
    const double s = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    const double scaled = s < 0.0 ? s * 32768.0 : s * 32767.0;
    return static_cast<int16_t>(std::lround(scaled));
}

std::vector<uint8_t> encode_wav(const std::vector<float>& samples, int sample_rate) {
    if (sample_rate <= 0) {
        throw InvalidConfiguration("sample rate must be positive, got " + std::to_string(sample_rate));
    }

    const uint64_t data_bytes = static_cast<uint64_t>(samples.size()) * kBlockAlign;
    if (data_bytes + kWavHeaderBytes - 8 > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("too many samples for a WAV file: " + std::to_string(samples.size()));
    }

    std::vector<uint8_t> out;
    out.reserve(kWavHeaderBytes + static_cast<std::size_t>(data_bytes));

    put_tag(out, "RIFF");
    put_u32(out, static_cast<uint32_t>(kWavHeaderBytes - 8 + data_bytes));
    put_tag(out, "WAVE");

    put_tag(out, "fmt ");
    put_u32(out, kFmtChunkBytes);
    put_u16(out, kFormatPcm);
    put_u16(out, kChannels);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * kBlockAlign);
    put_u16(out, kBlockAlign);
    put_u16(out, kBitsPerSample);

    put_tag(out, "data");
    put_u32(out, static_cast<uint32_t>(data_bytes));
    for (float sample : samples) {
        put_u16(out, static_cast<uint16_t>(pcm16_from_float(sample)));
    }
    return out;
}

DecodedWav decode_wav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12) {
        throw WavFormatError("WAV too short: " + std::to_string(bytes.size()) + " bytes");
    }
    const uint8_t* base = bytes.data();
    if (!tag_is(base, "RIFF") || !tag_is(base + 8, "WAVE")) {
        throw WavFormatError("missing RIFF/WAVE tags");
    }

    DecodedWav wav;
    bool have_fmt = false;
    std::size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = base + pos;
        const std::size_t length = get_u32(chunk + 4);
        const std::size_t body = pos + 8;
        const std::size_t available = bytes.size() - body;

        if (tag_is(chunk, "fmt ")) {
            if (length < kFmtChunkBytes || available < kFmtChunkBytes) {
                throw WavFormatError("fmt chunk too short");
            }
            const uint8_t* fmt = base + body;
            if (get_u16(fmt) != kFormatPcm) {
                throw WavFormatError("unsupported format code " + std::to_string(get_u16(fmt)));
            }
            if (get_u16(fmt + 2) != kChannels) {
                throw WavFormatError("expected mono, got " + std::to_string(get_u16(fmt + 2)) + " channels");
            }
            if (get_u16(fmt + 14) != kBitsPerSample) {
                throw WavFormatError("expected 16-bit samples, got " + std::to_string(get_u16(fmt + 14)));
            }
            const uint32_t rate = get_u32(fmt + 4);
            if (rate == 0 || rate > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
                throw WavFormatError("invalid sample rate " + std::to_string(rate));
            }
            wav.sample_rate = static_cast<int>(rate);
            have_fmt = true;
        } else if (tag_is(chunk, "data")) {
            if (!have_fmt) {
                throw WavFormatError("data chunk before fmt chunk");
            }
            const std::size_t usable = std::min(length, available) / kBlockAlign;
            wav.samples.resize(usable);
            for (std::size_t i = 0; i < usable; ++i) {
                wav.samples[i] = static_cast<int16_t>(get_u16(base + body + i * kBlockAlign));
            }
            return wav;
        }

        if (length > available) break;
        pos = body + length + (length & 1);
    }

    throw WavFormatError(have_fmt ? "missing data chunk" : "missing fmt chunk");
}
