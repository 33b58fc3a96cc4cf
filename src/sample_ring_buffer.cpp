#include "sample_ring_buffer.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

bool positive_finite(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

SampleRingBuffer::SampleRingBuffer(double retention_seconds)
    : retention_seconds_(retention_seconds) {
    if (!positive_finite(retention_seconds)) {
        throw InvalidConfiguration("retention window must be positive, got " +
                                   std::to_string(retention_seconds) + " s");
    }
}

void SampleRingBuffer::start(int sample_rate) {
    if (sample_rate <= 0) {
        throw InvalidConfiguration("sample rate must be positive, got " + std::to_string(sample_rate));
    }

    const double wanted = std::round(static_cast<double>(sample_rate) * retention_seconds_);
    std::vector<float> fresh;
    if (wanted < 1.0) {
        throw InvalidConfiguration("retention window holds no samples at " +
                                   std::to_string(sample_rate) + " Hz");
    }
    if (wanted > static_cast<double>(fresh.max_size())) {
        throw InvalidConfiguration("retention window too large at " +
                                   std::to_string(sample_rate) + " Hz");
    }
    fresh.resize(static_cast<std::size_t>(wanted));

    std::lock_guard<std::mutex> lock(mutex_);
    ring_.swap(fresh);
    write_pos_ = 0;
    retained_ = 0;
    sample_rate_ = sample_rate;
}

void SampleRingBuffer::clear() {
    std::vector<float> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ring_.swap(released);
        write_pos_ = 0;
        retained_ = 0;
        sample_rate_ = 0;
    }
}

void SampleRingBuffer::append(const float* data, std::size_t samples) {
    if (!data || samples == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sample_rate_ == 0) {
        throw std::logic_error("append called with no capture session started");
    }

    const std::size_t capacity = ring_.size();
    if (samples >= capacity) {
        // Only the newest capacity samples of the chunk survive.
        std::copy(data + (samples - capacity), data + samples, ring_.begin());
        write_pos_ = 0;
        retained_ = capacity;
        return;
    }

    const std::size_t first = std::min(samples, capacity - write_pos_);
    std::copy(data, data + first, ring_.begin() + static_cast<std::ptrdiff_t>(write_pos_));
    std::copy(data + first, data + samples, ring_.begin());

    write_pos_ = (write_pos_ + samples) % capacity;
    retained_ = std::min(retained_ + samples, capacity);
}

void SampleRingBuffer::append(const std::vector<float>& chunk) {
    append(chunk.data(), chunk.size());
}

std::vector<float> SampleRingBuffer::snapshot_last(double duration_seconds) const {
    if (!positive_finite(duration_seconds)) {
        throw InvalidConfiguration("export duration must be positive, got " +
                                   std::to_string(duration_seconds) + " s");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (retained_ == 0) return {};

    const double requested = std::round(duration_seconds * static_cast<double>(sample_rate_));
    const std::size_t count = requested >= static_cast<double>(retained_)
                                  ? retained_
                                  : static_cast<std::size_t>(requested);

    const std::size_t capacity = ring_.size();
    const std::size_t begin = (write_pos_ + capacity - count) % capacity;
    const std::size_t first = std::min(count, capacity - begin);

    std::vector<float> out;
    out.reserve(count);
    out.insert(out.end(),
               ring_.begin() + static_cast<std::ptrdiff_t>(begin),
               ring_.begin() + static_cast<std::ptrdiff_t>(begin + first));
    out.insert(out.end(),
               ring_.begin(),
               ring_.begin() + static_cast<std::ptrdiff_t>(count - first));
    return out;
}

double SampleRingBuffer::retained_duration_seconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sample_rate_ == 0) return 0.0;
    return static_cast<double>(retained_) / static_cast<double>(sample_rate_);
}

bool SampleRingBuffer::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_rate_ != 0;
}

int SampleRingBuffer::sample_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_rate_;
}

std::size_t SampleRingBuffer::retained_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retained_;
}

std::size_t SampleRingBuffer::capacity_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ring_.size();
}
