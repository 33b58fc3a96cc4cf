#include "config.hpp"

#include "errors.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

double positive_double(const char* name, double fallback) {
    const char* raw = env(name);
    if (!raw) return fallback;

    char* end = nullptr;
    double value = std::strtod(raw, &end);
    if (end == raw || *end != '\0' || !std::isfinite(value) || value <= 0.0) {
        throw InvalidConfiguration(std::string(name) + " must be a positive number, got \"" + raw + "\"");
    }
    return value;
}

unsigned positive_unsigned(const char* name, unsigned fallback) {
    const char* raw = env(name);
    if (!raw) return fallback;

    char* end = nullptr;
    long value = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || value <= 0 || value > 1000000) {
        throw InvalidConfiguration(std::string(name) + " must be a positive integer, got \"" + raw + "\"");
    }
    return static_cast<unsigned>(value);
}

} // namespace

AppConfig load_config() {
    AppConfig cfg;

    if (const char* device = env("BACKTRACK_DEVICE")) cfg.audio.device = device;
    cfg.audio.sample_rate = positive_unsigned("BACKTRACK_SAMPLE_RATE", cfg.audio.sample_rate);
    cfg.audio.frames_per_buffer = positive_unsigned("BACKTRACK_FRAMES_PER_BUFFER", cfg.audio.frames_per_buffer);

    cfg.retention_seconds = positive_double("BACKTRACK_RETENTION_SECONDS", cfg.retention_seconds);
    cfg.export_seconds = positive_double("BACKTRACK_EXPORT_SECONDS", cfg.export_seconds);

    if (const char* output = env("BACKTRACK_OUTPUT")) cfg.output_path = output;
    if (const char* model = env("BACKTRACK_VOSK_MODEL")) cfg.vosk_model = model;

    return cfg;
}
