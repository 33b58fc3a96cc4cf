#include "utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <stdexcept>

float rms(const std::vector<float>& x) {
    if (x.empty()) return 0.0f;
    double acc = 0.0;
    for (auto sample : x) {
        acc += static_cast<double>(sample) * static_cast<double>(sample);
    }
    double mean = acc / static_cast<double>(x.size());
    return static_cast<float>(std::sqrt(mean));
}

float dbfs(const std::vector<float>& x) {
    const float r = rms(x); // samples are already normalized to full scale
    return 20.0f * std::log10(r + 1e-9f);
}

void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + path + ": " + std::strerror(errno));
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}
