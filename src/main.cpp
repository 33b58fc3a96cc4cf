#include "audio_capture.hpp"
#include "config.hpp"
#include "sample_ring_buffer.hpp"
#include "transcriber.hpp"
#include "utils.hpp"
#include "wav_encoder.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {
std::atomic<bool> g_running{true};
std::atomic<bool> g_export_requested{false};

void handle_sigint(int) {
    g_running = false;
}

void handle_sigusr1(int) {
    g_export_requested = true;
}

void capture_loop(AudioCapture& capture, SampleRingBuffer& ring, std::atomic<bool>& capture_ok) {
    std::vector<float> chunk;
    int blocks = 0;
    try {
        while (g_running) {
            if (capture.read(chunk) == 0) continue;
            ring.append(chunk);

            // Roughly once a second at the default period size.
            if (++blocks % 32 == 0) {
                std::cout << "[Level] " << dbfs(chunk) << " dBFS, buffered "
                          << ring.retained_duration_seconds() << " s\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Capture stopped: " << e.what() << "\n";
        capture_ok = false;
        g_running = false;
    }
}

void export_tail(const AppConfig& cfg, const SampleRingBuffer& ring, Transcriber* transcriber) {
    std::vector<float> tail = ring.snapshot_last(cfg.export_seconds);
    std::vector<uint8_t> file = encode_wav(tail, ring.sample_rate());
    write_file(cfg.output_path, file);

    std::cout << "[Export] " << tail.size() << " samples ("
              << static_cast<double>(tail.size()) / ring.sample_rate() << " s) -> "
              << cfg.output_path << " (" << file.size() << " bytes)\n";

    if (!transcriber) return;
    std::vector<TranscriptSegment> segments = transcriber->transcribe(file);
    if (segments.empty()) {
        std::cout << "[Transcription] (no speech recognised)\n";
    }
    for (const auto& segment : segments) {
        std::cout << "[Transcription] Speaker " << segment.speaker_id << ": " << segment.text << "\n";
    }
}
} // namespace

int main() {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGUSR1, handle_sigusr1);

    AppConfig cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }
    if (cfg.export_seconds > cfg.retention_seconds) {
        std::cout << "Warning: export window " << cfg.export_seconds << " s exceeds retention window "
                  << cfg.retention_seconds << " s; exports are capped at the retention window.\n";
    }

    std::cout << "Listing input devices...\n";
    AudioCapture::list_devices();

    std::unique_ptr<AudioCapture> capture;
    SampleRingBuffer ring(cfg.retention_seconds);
    try {
        capture = std::make_unique<AudioCapture>(cfg.audio);
        capture->start();
        ring.start(static_cast<int>(capture->sample_rate()));
    } catch (const std::exception& e) {
        std::cerr << "Failed to start audio capture: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<Transcriber> transcriber;
    try {
        transcriber = std::make_unique<Transcriber>(cfg.vosk_model);
        if (transcriber->available()) {
            std::cout << "Transcription enabled using model: " << cfg.vosk_model << "\n";
        } else {
            std::cout << "Transcription unavailable (model not ready).\n";
            transcriber.reset();
        }
    } catch (const std::exception& e) {
        std::cout << "Transcription disabled: " << e.what() << "\n";
    }

    std::atomic<bool> capture_ok{true};
    std::thread capture_thread(capture_loop, std::ref(*capture), std::ref(ring), std::ref(capture_ok));

    std::cout << "\nRecording " << ring.sample_rate() << " Hz, keeping the last " << cfg.retention_seconds
              << " s. Send SIGUSR1 to export the last " << cfg.export_seconds
              << " s, Ctrl+C to stop and export.\n";

    int status = 0;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (g_export_requested.exchange(false)) {
            try {
                export_tail(cfg, ring, transcriber.get());
            } catch (const std::exception& e) {
                std::cerr << "Export failed: " << e.what() << "\n";
            }
        }
    }

    capture_thread.join();
    capture.reset();

    try {
        export_tail(cfg, ring, transcriber.get());
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        status = 1;
    }
    ring.clear();

    if (!capture_ok) status = 1;
    std::cout << "Exiting.\n";
    return status;
}
