#include "audio_capture.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <cstdio>
#include <sstream>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

struct HwParams {
    snd_pcm_hw_params_t* ptr{nullptr};
    HwParams() {
        int err = snd_pcm_hw_params_malloc(&ptr);
        if (err < 0 || !ptr) {
            throw std::runtime_error("Failed to allocate ALSA hw params");
        }
    }
    ~HwParams() { snd_pcm_hw_params_free(ptr); }
};

} // namespace

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig& cfg);
    ~Impl();

    void start();
    std::size_t read(std::vector<float>& out);
    unsigned sample_rate() const { return cfg_.sample_rate; }
    static void list_devices();

private:
    void check(int err, const char* context) {
        if (err < 0) throw std::runtime_error(alsa_error(err, context));
    }

    AudioConfig cfg_;
    snd_pcm_t* handle_{nullptr};
    bool started_{false};
};

AudioCapture::Impl::Impl(const AudioConfig& cfg) : cfg_(cfg) {}

AudioCapture::Impl::~Impl() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

void AudioCapture::Impl::start() {
    if (started_) return;

    check(snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0), "snd_pcm_open");

    HwParams hw;
    check(snd_pcm_hw_params_any(handle_, hw.ptr), "snd_pcm_hw_params_any");
    check(snd_pcm_hw_params_set_access(handle_, hw.ptr, SND_PCM_ACCESS_RW_INTERLEAVED),
          "snd_pcm_hw_params_set_access");
    check(snd_pcm_hw_params_set_format(handle_, hw.ptr, SND_PCM_FORMAT_FLOAT_LE),
          "snd_pcm_hw_params_set_format");
    check(snd_pcm_hw_params_set_channels(handle_, hw.ptr, 1), "snd_pcm_hw_params_set_channels");

    unsigned int rate = cfg_.sample_rate;
    check(snd_pcm_hw_params_set_rate_near(handle_, hw.ptr, &rate, nullptr),
          "snd_pcm_hw_params_set_rate_near");
    if (rate != cfg_.sample_rate) {
        std::cout << "Warning: sample rate adjusted to " << rate << " Hz\n";
        cfg_.sample_rate = rate;
    }

    snd_pcm_uframes_t frames = cfg_.frames_per_buffer;
    check(snd_pcm_hw_params_set_period_size_near(handle_, hw.ptr, &frames, nullptr),
          "snd_pcm_hw_params_set_period_size_near");
    cfg_.frames_per_buffer = static_cast<unsigned>(frames);

    check(snd_pcm_hw_params(handle_, hw.ptr), "snd_pcm_hw_params");
    check(snd_pcm_prepare(handle_), "snd_pcm_prepare");

    started_ = true;
}

std::size_t AudioCapture::Impl::read(std::vector<float>& out) {
    if (!handle_) return 0;

    out.resize(cfg_.frames_per_buffer);
    snd_pcm_sframes_t frames = snd_pcm_readi(handle_, out.data(), cfg_.frames_per_buffer);
    if (frames < 0) {
        frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
    }
    if (frames < 0) {
        throw std::runtime_error(alsa_error(static_cast<int>(frames), "snd_pcm_readi"));
    }

    out.resize(static_cast<std::size_t>(frames));
    return out.size();
}

void AudioCapture::Impl::list_devices() {
    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        std::cout << "No ALSA capture devices found.\n";
        return;
    }

    std::cout << "ALSA capture devices (use \"plughw:x,y\"):\n";
    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cout << "  (Failed to allocate pcm_info)\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (snd_ctl_pcm_next_device(ctl, &device) >= 0 && device >= 0) {
            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            std::cout << "- plughw:" << card << "," << device;
            if (name) std::cout << " (" << name << ")";
            std::cout << "\n";
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
}

#else

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig&) {
        throw std::runtime_error("Audio capture not supported on this platform");
    }
    ~Impl() = default;
    void start() {}
    std::size_t read(std::vector<float>&) { return 0; }
    unsigned sample_rate() const { return 0; }
    static void list_devices() {
        std::cout << "Audio capture not supported on this platform.\n";
    }
};

#endif

AudioCapture::AudioCapture(const AudioConfig& cfg) : impl_(new Impl(cfg)) {}

AudioCapture::~AudioCapture() { delete impl_; }

void AudioCapture::start() { impl_->start(); }

std::size_t AudioCapture::read(std::vector<float>& out) { return impl_->read(out); }

unsigned AudioCapture::sample_rate() const { return impl_->sample_rate(); }

void AudioCapture::list_devices() { Impl::list_devices(); }
