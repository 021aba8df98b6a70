#include "audio/audio_utils.h"

#include "logging/logger.h"

#include <algorithm>
#include <cstdint>

namespace AudioUtils {

std::vector<float> resampleLinear(const std::vector<float>& mono, int sourceRate,
                                  int targetRate) {
    std::vector<float> out;
    if (mono.empty() || sourceRate <= 0 || targetRate <= 0) {
        return out;
    }
    if (sourceRate == targetRate) {
        return mono;
    }

    const uint64_t outLen = (static_cast<uint64_t>(mono.size()) * static_cast<uint64_t>(targetRate)) /
                            static_cast<uint64_t>(sourceRate);
    out.resize(static_cast<size_t>(outLen));

    const double step = static_cast<double>(sourceRate) / static_cast<double>(targetRate);
    const size_t last = mono.size() - 1;
    for (size_t i = 0; i < out.size(); ++i) {
        double pos = static_cast<double>(i) * step;
        size_t idx = static_cast<size_t>(pos);
        if (idx >= last) {
            out[i] = mono[last];
            continue;
        }
        float frac = static_cast<float>(pos - static_cast<double>(idx));
        out[i] = mono[idx] + (mono[idx + 1] - mono[idx]) * frac;
    }
    return out;
}

std::vector<float> convertToTarget(const float* interleaved, size_t frames, int sourceRate,
                                   int channels, int targetRate) {
    if (sourceRate <= 0 || channels <= 0 || targetRate <= 0) {
        LOG_EVERY_N(WARN, 100, "[AudioUtils] Rejecting buffer (rate={}, channels={}, target={})",
                    sourceRate, channels, targetRate);
        return {};
    }
    if (!interleaved || frames == 0) {
        return {};
    }

    std::vector<float> mono = downmixToMono(interleaved, frames, channels);
    return resampleLinear(mono, sourceRate, targetRate);
}

std::vector<float> normalizeToTarget(const float* interleaved, size_t frames, int sourceRate,
                                     int channels, int targetRate) {
    std::vector<float> out = convertToTarget(interleaved, frames, sourceRate, channels, targetRate);
    peakNormalize(out);
    return out;
}

}  // namespace AudioUtils
