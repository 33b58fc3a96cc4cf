#pragma once

#include <string>

#include "audio_capture.hpp"

struct AppConfig {
    AudioConfig audio;
    double retention_seconds = 30.0;       // memory ceiling for the ring buffer
    double export_seconds = 10.0;          // tail length written per export
    std::string output_path = "recording.wav";
    std::string vosk_model = "models/vosk-model-small-en-us-0.15";
};

// Defaults overridden by BACKTRACK_* environment variables.
AppConfig load_config();
