#pragma once

#include "audio/audio_format.h"
#include "core/scribe_constants.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace AudioUtils {

struct MixerConfig {
    int sampleRate = ScribeConstants::TARGET_SAMPLE_RATE;
    double blockSeconds = ScribeConstants::DEFAULT_MIX_BLOCK_SECONDS;
    // How far one source may run ahead before the other is zero-filled
    double maxLagSeconds = ScribeConstants::DEFAULT_MAX_LAG_SECONDS;
    float systemWeight = ScribeConstants::DEFAULT_SYSTEM_WEIGHT;
    float microphoneWeight = ScribeConstants::DEFAULT_MICROPHONE_WEIGHT;
    bool normalizeOutput = true;
};

// Weighted sum of both slices, tanh soft clip, then peak normalization to 0.9
// (skipped when normalize is false). The shorter slice is treated as zero past
// its end; the result has the length of the longer one.
std::vector<float> mixBlocks(const std::vector<float>& system, const std::vector<float>& microphone,
                             float systemWeight, float microphoneWeight, bool normalize = true);

// Sample-domain aligner for two 16 kHz mono streams.
//
// Each source has its own FIFO and a consumed-sample offset. Blocks are mixed
// position-for-position: sample N of the microphone stream is mixed with
// sample N of the system stream. A source that falls more than maxLagSeconds
// behind is zero-filled for the missing part and its offset advances only by
// what it actually delivered, so a stalled source reads as silence and never
// holds the other one back.
class StreamMixer {
   public:
    explicit StreamMixer(const MixerConfig& config = MixerConfig{});

    // Queues samples for tag and returns every mixed block that became ready.
    std::vector<float> push(AudioSourceTag tag, const std::vector<float>& samples);

    // Mixes everything still pending, zero-filling the shorter side.
    std::vector<float> flush();

    void reset();

    size_t pendingSamples(AudioSourceTag tag) const {
        return pending_[sourceTagIndex(tag)].size();
    }
    uint64_t consumedSamples(AudioSourceTag tag) const {
        return consumed_[sourceTagIndex(tag)];
    }
    uint64_t zeroFilledSamples(AudioSourceTag tag) const {
        return zeroFilled_[sourceTagIndex(tag)];
    }
    uint64_t mixedSamples() const {
        return mixedSamples_;
    }
    const MixerConfig& config() const {
        return config_;
    }

   private:
    std::vector<float> take(AudioSourceTag tag, size_t count);
    void mixInto(std::vector<float>& out, size_t blockLen);

    MixerConfig config_;
    size_t blockSamples_;
    size_t lagSamples_;

    std::array<std::deque<float>, kSourceTagCount> pending_;
    std::array<uint64_t, kSourceTagCount> consumed_{};
    std::array<uint64_t, kSourceTagCount> zeroFilled_{};
    uint64_t mixedSamples_ = 0;
};

}  // namespace AudioUtils
