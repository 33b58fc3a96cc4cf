#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

// Keeps the most recent retention window of mono float samples for one
// capture session. One thread may append while another takes snapshots.
class SampleRingBuffer {
public:
    explicit SampleRingBuffer(double retention_seconds);

    // Begins a new session; drops everything retained by the previous one.
    void start(int sample_rate);

    // Ends the session and releases the storage.
    void clear();

    void append(const float* data, std::size_t samples);
    void append(const std::vector<float>& chunk);

    // Copy of the newest duration_seconds of audio, oldest first. Saturates
    // to everything retained.
    std::vector<float> snapshot_last(double duration_seconds) const;

    double retained_duration_seconds() const;

    bool active() const;
    int sample_rate() const;
    std::size_t retained_samples() const;
    std::size_t capacity_samples() const;
    double retention_seconds() const { return retention_seconds_; }

private:
    const double retention_seconds_;

    mutable std::mutex mutex_;
    std::vector<float> ring_;
    std::size_t write_pos_{0};
    std::size_t retained_{0};
    int sample_rate_{0};
};
