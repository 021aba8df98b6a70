#include "capture/alsa_capture_source.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <utility>
#include <vector>

namespace capture {
namespace {

void waitForCaptureReady(snd_pcm_t* handle) {
    if (!handle) {
        return;
    }
    int ret = snd_pcm_wait(handle, 100);
    if (ret < 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace

AlsaCaptureParams alsaParamsFromConfig(const AppConfig::CaptureConfig& cfg, AudioSourceTag tag) {
    AlsaCaptureParams params;
    params.device =
        tag == AudioSourceTag::Microphone ? cfg.microphoneDevice : cfg.systemDevice;
    params.format = parsePcmFormat(cfg.format);
    params.sampleRate = cfg.sampleRate;
    params.channels = cfg.channels;
    params.periodFrames = cfg.periodFrames;
    return params;
}

snd_pcm_format_t toAlsaFormat(PcmFormat format) {
    switch (format) {
    case PcmFormat::S16_LE:
        return SND_PCM_FORMAT_S16_LE;
    case PcmFormat::S24_3LE:
        return SND_PCM_FORMAT_S24_3LE;
    case PcmFormat::S32_LE:
        return SND_PCM_FORMAT_S32_LE;
    case PcmFormat::Unknown:
        break;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

AlsaCaptureSource::AlsaCaptureSource(AudioSourceTag tag, AlsaCaptureParams params)
    : tag_(tag), params_(std::move(params)) {}

AlsaCaptureSource::~AlsaCaptureSource() {
    stop();
}

snd_pcm_t* AlsaCaptureSource::openDevice() {
    const char* label = AudioUtils::sourceTagToString(tag_);
    snd_pcm_format_t format = toAlsaFormat(params_.format);
    if (format == SND_PCM_FORMAT_UNKNOWN) {
        LOG_ERROR("[Capture:{}] Unsupported format ({})", label,
                  ScribeErrors::errorCodeToString(
                      ScribeErrors::ErrorCode::AUDIO_UNSUPPORTED_FORMAT));
        return nullptr;
    }

    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, params_.device.c_str(), SND_PCM_STREAM_CAPTURE,
                           SND_PCM_NONBLOCK);
    if (err < 0) {
        LOG_ERROR("[Capture:{}] Cannot open capture device {}: {} ({})", label, params_.device,
                  snd_strerror(err),
                  ScribeErrors::errorCodeToString(
                      ScribeErrors::ErrorCode::AUDIO_DEVICE_OPEN_FAILED));
        return nullptr;
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(handle, hw_params);

    if ((err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) <
            0 ||
        (err = snd_pcm_hw_params_set_format(handle, hw_params, format)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot set access/format: {}", label, snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }

    if ((err = snd_pcm_hw_params_set_channels(handle, hw_params, params_.channels)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot set channels {}: {}", label, params_.channels,
                  snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }

    // Any rate works downstream; accept what the device offers
    unsigned int rateNear = params_.sampleRate;
    if ((err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rateNear, nullptr)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot set rate {}: {}", label, params_.sampleRate,
                  snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }
    if (rateNear != params_.sampleRate) {
        LOG_WARN("[Capture:{}] Requested rate {} not supported, using {}", label,
                 params_.sampleRate, rateNear);
        params_.sampleRate = rateNear;
    }

    snd_pcm_uframes_t periodFrames = params_.periodFrames;
    snd_pcm_uframes_t bufferFrames = std::max<snd_pcm_uframes_t>(periodFrames * 4, periodFrames);
    if ((err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &periodFrames,
                                                      nullptr)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot set period size: {}", label, snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }
    bufferFrames = std::max<snd_pcm_uframes_t>(bufferFrames, periodFrames * 2);
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &bufferFrames)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot set buffer size: {}", label, snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }

    if ((err = snd_pcm_hw_params(handle, hw_params)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot apply hardware parameters: {}", label, snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }

    snd_pcm_hw_params_get_period_size(hw_params, &periodFrames, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &bufferFrames);
    params_.periodFrames = periodFrames;

    if ((err = snd_pcm_prepare(handle)) < 0) {
        LOG_ERROR("[Capture:{}] Cannot prepare capture device: {}", label, snd_strerror(err));
        snd_pcm_close(handle);
        return nullptr;
    }
    if ((err = snd_pcm_start(handle)) < 0) {
        LOG_WARN("[Capture:{}] snd_pcm_start: {}", label, snd_strerror(err));
    }

    LOG_INFO(
        "[Capture:{}] Device {} configured ({} Hz, {} ch, {}, period {} frames, buffer {} frames)",
        label, params_.device, params_.sampleRate, params_.channels,
        pcmFormatToString(params_.format), periodFrames, bufferFrames);
    return handle;
}

bool AlsaCaptureSource::start(SampleCallback callback) {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (running_.load(std::memory_order_acquire)) {
        return true;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    snd_pcm_t* handle = openDevice();
    if (!handle) {
        return false;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(
        [this, handle, cb = std::move(callback)]() mutable { captureLoop(handle, std::move(cb)); });
    return true;
}

void AlsaCaptureSource::stop() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AlsaCaptureSource::captureLoop(snd_pcm_t* handle, SampleCallback callback) {
    const char* label = AudioUtils::sourceTagToString(tag_);
    const AudioFormat format{static_cast<int>(params_.sampleRate),
                             static_cast<int>(params_.channels)};
    const snd_pcm_uframes_t period = params_.periodFrames;
    std::vector<uint8_t> raw(static_cast<size_t>(period) * params_.channels *
                             pcmBytesPerSample(params_.format));
    std::vector<float> floatBuffer;

    while (running_.load(std::memory_order_acquire)) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle, raw.data(), period);
        if (frames == -EAGAIN) {
            waitForCaptureReady(handle);
            continue;
        }
        if (frames == -EPIPE) {
            xruns_.fetch_add(1, std::memory_order_relaxed);
            LOG_EVERY_N(WARN, 10, "[Capture:{}] XRUN detected, recovering ({})", label,
                        ScribeErrors::errorCodeToString(
                            ScribeErrors::ErrorCode::AUDIO_XRUN_DETECTED));
            snd_pcm_prepare(handle);
            snd_pcm_start(handle);
            continue;
        }
        if (frames < 0) {
            LOG_WARN("[Capture:{}] Read error: {}", label,
                     snd_strerror(static_cast<int>(frames)));
            if (snd_pcm_recover(handle, static_cast<int>(frames), 1) < 0) {
                LOG_ERROR("[Capture:{}] Recover failed, retrying read loop", label);
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }
        if (frames == 0) {
            waitForCaptureReady(handle);
            continue;
        }

        if (!convertPcmToFloat(raw.data(), params_.format, static_cast<size_t>(frames),
                               params_.channels, floatBuffer)) {
            LOG_ERROR("[Capture:{}] Unsupported format during conversion", label);
            break;
        }
        if (callback) {
            callback(floatBuffer.data(), static_cast<size_t>(frames), format);
        }
    }

    snd_pcm_drop(handle);
    snd_pcm_close(handle);
    running_.store(false, std::memory_order_release);
    LOG_INFO("[Capture:{}] Capture thread terminated", label);
}

}  // namespace capture
