#include "audio/stream_mixer.h"

#include "audio/audio_utils.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>

namespace AudioUtils {

std::vector<float> mixBlocks(const std::vector<float>& system, const std::vector<float>& microphone,
                             float systemWeight, float microphoneWeight, bool normalize) {
    const size_t len = std::max(system.size(), microphone.size());
    std::vector<float> mixed(len, 0.0f);
    for (size_t i = 0; i < len; ++i) {
        float s = i < system.size() ? system[i] : 0.0f;
        float m = i < microphone.size() ? microphone[i] : 0.0f;
        mixed[i] = std::tanh(s * systemWeight + m * microphoneWeight);
    }
    if (normalize) {
        peakNormalize(mixed);
    }
    return mixed;
}

StreamMixer::StreamMixer(const MixerConfig& config)
    : config_(config),
      blockSamples_(std::max<size_t>(
          1, static_cast<size_t>(std::llround(config.blockSeconds * config.sampleRate)))),
      lagSamples_(static_cast<size_t>(
          std::llround(std::max(0.0, config.maxLagSeconds) * config.sampleRate))) {}

std::vector<float> StreamMixer::take(AudioSourceTag tag, size_t count) {
    auto& fifo = pending_[sourceTagIndex(tag)];
    const size_t n = std::min(count, fifo.size());
    std::vector<float> out(fifo.begin(), fifo.begin() + static_cast<std::ptrdiff_t>(n));
    fifo.erase(fifo.begin(), fifo.begin() + static_cast<std::ptrdiff_t>(n));
    consumed_[sourceTagIndex(tag)] += n;
    if (n < count) {
        zeroFilled_[sourceTagIndex(tag)] += count - n;
    }
    return out;
}

void StreamMixer::mixInto(std::vector<float>& out, size_t blockLen) {
    std::vector<float> system = take(AudioSourceTag::SystemAudio, blockLen);
    std::vector<float> mic = take(AudioSourceTag::Microphone, blockLen);
    std::vector<float> mixed = mixBlocks(system, mic, config_.systemWeight,
                                         config_.microphoneWeight, config_.normalizeOutput);
    // Both slices may be short during flush; keep the block length the caller asked for
    mixed.resize(blockLen, 0.0f);
    out.insert(out.end(), mixed.begin(), mixed.end());
    mixedSamples_ += blockLen;
}

std::vector<float> StreamMixer::push(AudioSourceTag tag, const std::vector<float>& samples) {
    auto& fifo = pending_[sourceTagIndex(tag)];
    fifo.insert(fifo.end(), samples.begin(), samples.end());

    std::vector<float> out;
    const auto& sys = pending_[sourceTagIndex(AudioSourceTag::SystemAudio)];
    const auto& mic = pending_[sourceTagIndex(AudioSourceTag::Microphone)];
    while (true) {
        const bool sysReady = sys.size() >= blockSamples_;
        const bool micReady = mic.size() >= blockSamples_;
        if (sysReady && micReady) {
            mixInto(out, blockSamples_);
            continue;
        }
        const size_t leader = std::max(sys.size(), mic.size());
        if ((sysReady || micReady) && leader >= blockSamples_ + lagSamples_) {
            AudioSourceTag lagging =
                sysReady ? AudioSourceTag::Microphone : AudioSourceTag::SystemAudio;
            LOG_EVERY_N(WARN, 50, "[Mixer] {} source lagging by {} samples; zero-filling",
                        sourceTagToString(lagging), leader - pendingSamples(lagging));
            mixInto(out, blockSamples_);
            continue;
        }
        break;
    }
    return out;
}

std::vector<float> StreamMixer::flush() {
    std::vector<float> out;
    const size_t remaining = std::max(pendingSamples(AudioSourceTag::SystemAudio),
                                      pendingSamples(AudioSourceTag::Microphone));
    if (remaining > 0) {
        mixInto(out, remaining);
    }
    return out;
}

void StreamMixer::reset() {
    for (auto& fifo : pending_) {
        fifo.clear();
    }
    consumed_.fill(0);
    zeroFilled_.fill(0);
    mixedSamples_ = 0;
}

}  // namespace AudioUtils
