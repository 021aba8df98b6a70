#include "audio/chunk_windower.h"

#include "audio/audio_utils.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>

namespace AudioUtils {
namespace {

size_t secondsToSamples(double seconds, int sampleRate) {
    if (seconds <= 0.0 || sampleRate <= 0) {
        return 0;
    }
    return static_cast<size_t>(std::llround(seconds * static_cast<double>(sampleRate)));
}

}  // namespace

ChunkWindower::ChunkWindower(const WindowerConfig& config, std::optional<AudioSourceTag> source)
    : config_(config),
      source_(source),
      chunkSamples_(std::max<size_t>(1, secondsToSamples(config.chunkSeconds, config.sampleRate))),
      overlapSamples_(secondsToSamples(config.overlapSeconds, config.sampleRate)),
      silenceSamples_(secondsToSamples(config.silenceSeconds, config.sampleRate)) {
    if (overlapSamples_ >= chunkSamples_) {
        LOG_WARN("[Windower] overlap ({} samples) >= chunk ({} samples); disabling overlap",
                 overlapSamples_, chunkSamples_);
        overlapSamples_ = 0;
    }
}

AudioWindow ChunkWindower::makeWindow(std::vector<float> samples, WindowReason reason) const {
    AudioWindow window;
    const double rate = static_cast<double>(config_.sampleRate);
    window.startTime = static_cast<double>(processedSamples_) / rate;
    window.endTime = window.startTime + static_cast<double>(samples.size()) / rate;
    window.samples = std::move(samples);
    window.source = source_;
    window.reason = reason;
    return window;
}

std::vector<AudioWindow> ChunkWindower::feed(const std::vector<float>& samples) {
    std::vector<AudioWindow> ready;
    if (samples.empty()) {
        return ready;
    }

    buffer_.insert(buffer_.end(), samples.begin(), samples.end());

    if (buffer_.size() >= chunkSamples_) {
        const size_t hop = chunkSamples_ - overlapSamples_;
        while (buffer_.size() >= chunkSamples_) {
            std::vector<float> chunk(buffer_.begin(),
                                     buffer_.begin() + static_cast<std::ptrdiff_t>(chunkSamples_));
            ready.push_back(makeWindow(std::move(chunk), WindowReason::FullChunk));
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(hop));
            processedSamples_ += hop;
        }
        return ready;
    }

    // Silence is judged on the tail of the block just fed, not the whole buffer
    if (silenceSamples_ == 0 || samples.size() < silenceSamples_) {
        return ready;
    }
    const float* tail = samples.data() + (samples.size() - silenceSamples_);
    const float rms = computeRms(tail, silenceSamples_);
    if (rms < config_.silenceThreshold && buffer_.size() > silenceSamples_) {
        const size_t consumed = buffer_.size();
        LOG_DEBUG("[Windower] Silence cut at {:.2f}s ({} samples, rms={:.4f})",
                  static_cast<double>(processedSamples_) / config_.sampleRate, consumed, rms);
        std::vector<float> whole;
        whole.swap(buffer_);
        ready.push_back(makeWindow(std::move(whole), WindowReason::Silence));
        processedSamples_ += consumed;
    }
    return ready;
}

std::optional<AudioWindow> ChunkWindower::flush() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    const size_t consumed = buffer_.size();
    std::vector<float> rest;
    rest.swap(buffer_);
    AudioWindow window = makeWindow(std::move(rest), WindowReason::Flush);
    processedSamples_ += consumed;
    return window;
}

void ChunkWindower::reset() {
    buffer_.clear();
    buffer_.shrink_to_fit();
    processedSamples_ = 0;
}

}  // namespace AudioUtils
