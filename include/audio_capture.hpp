#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct AudioConfig {
    unsigned sample_rate = 16000;          // 16 kHz is enough for speech
    unsigned frames_per_buffer = 512;      // period size per read
    std::string device = "default";        // ALSA device name or default input
};

// Mono float capture; samples are normalized to [-1, 1].
class AudioCapture {
public:
    explicit AudioCapture(const AudioConfig& cfg);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void start();
    std::size_t read(std::vector<float>& out);

    // Rate granted by the device; only meaningful after start().
    unsigned sample_rate() const;

    static void list_devices();

private:
    struct Impl;
    Impl* impl_;
};
