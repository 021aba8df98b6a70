#ifndef LIVE_SCRIBE_AUDIO_UTILS_H
#define LIVE_SCRIBE_AUDIO_UTILS_H

#include "core/scribe_constants.h"

#include <cmath>
#include <cstddef>
#include <vector>

// Sample conversion helpers shared by the pipeline worker, the mixer and the tests.
// Everything here is buffer-local: no state is carried between calls.

namespace AudioUtils {

// Equal-weight average of all channels per frame: interleaved -> mono
inline std::vector<float> downmixToMono(const float* interleaved, size_t frames, int channels) {
    std::vector<float> mono;
    if (!interleaved || frames == 0 || channels <= 0) {
        return mono;
    }
    mono.resize(frames);
    if (channels == 1) {
        mono.assign(interleaved, interleaved + frames);
        return mono;
    }
    const float inv = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        const float* frame = interleaved + i * static_cast<size_t>(channels);
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += frame[ch];
        }
        mono[i] = sum * inv;
    }
    return mono;
}

inline float computePeak(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        float value = std::fabs(samples[i]);
        if (value > peak) {
            peak = value;
        }
    }
    return peak;
}

inline float computeRms(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sumSquares = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sumSquares += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sumSquares / static_cast<double>(count)));
}

// Scales the buffer so its peak equals targetPeak. No-op for an all-zero buffer.
inline void peakNormalize(std::vector<float>& samples,
                          float targetPeak = ScribeConstants::NORMALIZE_PEAK) {
    float peak = computePeak(samples.data(), samples.size());
    if (peak <= 0.0f) {
        return;
    }
    const float scale = targetPeak / peak;
    for (auto& s : samples) {
        s *= scale;
    }
}

// Linear interpolation between neighbouring samples.
// Output length is floor(input * targetRate / sourceRate).
//
// Not band-limited: content above the target Nyquist folds back. This keeps
// per-buffer latency at zero; a windowed-sinc resampler can replace it behind
// the same signature.
std::vector<float> resampleLinear(const std::vector<float>& mono, int sourceRate, int targetRate);

// Down-mix and resample to targetRate without any gain change.
// Returns an empty buffer (and logs) when sourceRate or channels is not positive.
std::vector<float> convertToTarget(const float* interleaved, size_t frames, int sourceRate,
                                   int channels,
                                   int targetRate = ScribeConstants::TARGET_SAMPLE_RATE);

// convertToTarget followed by peak normalization to 0.9.
// Returns an empty buffer (and logs) when sourceRate or channels is not positive.
std::vector<float> normalizeToTarget(const float* interleaved, size_t frames, int sourceRate,
                                     int channels,
                                     int targetRate = ScribeConstants::TARGET_SAMPLE_RATE);

}  // namespace AudioUtils

#endif  // LIVE_SCRIBE_AUDIO_UTILS_H
