#pragma once

#include "capture/audio_source.h"
#include "capture/pcm_convert.h"
#include "core/config_loader.h"

#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace capture {

struct AlsaCaptureParams {
    std::string device = "default";
    PcmFormat format = PcmFormat::S16_LE;
    unsigned int sampleRate = 48000;
    unsigned int channels = 2;
    snd_pcm_uframes_t periodFrames = 1024;
};

// Builds params for the microphone or system device from the capture section.
AlsaCaptureParams alsaParamsFromConfig(const AppConfig::CaptureConfig& cfg, AudioSourceTag tag);

snd_pcm_format_t toAlsaFormat(PcmFormat format);

// Interleaved capture from one ALSA PCM (microphone, or the loopback device
// carrying system playback). Xruns and read errors are recovered in place and
// show up downstream as a gap, never as a stopped source.
class AlsaCaptureSource final : public AudioSource {
   public:
    AlsaCaptureSource(AudioSourceTag tag, AlsaCaptureParams params);
    ~AlsaCaptureSource() override;

    AlsaCaptureSource(const AlsaCaptureSource&) = delete;
    AlsaCaptureSource& operator=(const AlsaCaptureSource&) = delete;

    const char* name() const override {
        return "alsa";
    }
    AudioSourceTag tag() const override {
        return tag_;
    }

    bool start(SampleCallback callback) override;
    void stop() override;

    bool running() const override {
        return running_.load(std::memory_order_acquire);
    }

    uint64_t xrunCount() const {
        return xruns_.load(std::memory_order_relaxed);
    }

   private:
    snd_pcm_t* openDevice();
    void captureLoop(snd_pcm_t* handle, SampleCallback callback);

    AudioSourceTag tag_;
    AlsaCaptureParams params_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> xruns_{0};
    std::mutex threadMutex_;
    std::thread thread_;
};

}  // namespace capture
