#pragma once

#include "audio/audio_format.h"
#include "core/scribe_constants.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Rolling-buffer windower that cuts normalized 16 kHz audio into overlapping
// windows for the recognizer.
//
// A window is cut either when the buffer reaches one chunk (the overlap tail is
// kept for the next window) or, earlier, when the newly fed block ends in
// silence. Window times come from the processed-sample counter, never from a
// clock, so they are reproducible for a given feed sequence.

namespace AudioUtils {

struct WindowerConfig {
    int sampleRate = ScribeConstants::TARGET_SAMPLE_RATE;
    double chunkSeconds = ScribeConstants::DEFAULT_CHUNK_SECONDS;
    double overlapSeconds = ScribeConstants::DEFAULT_OVERLAP_SECONDS;
    float silenceThreshold = ScribeConstants::DEFAULT_SILENCE_THRESHOLD;
    double silenceSeconds = ScribeConstants::DEFAULT_SILENCE_SECONDS;
};

enum class WindowReason { FullChunk, Silence, Flush };

struct AudioWindow {
    std::vector<float> samples;
    double startTime = 0.0;  // seconds since session start
    double endTime = 0.0;
    std::optional<AudioSourceTag> source;  // empty for the mixed stream
    WindowReason reason = WindowReason::FullChunk;
};

class ChunkWindower {
   public:
    explicit ChunkWindower(const WindowerConfig& config = WindowerConfig{},
                           std::optional<AudioSourceTag> source = std::nullopt);

    // Appends samples and returns every window that became ready, in order.
    std::vector<AudioWindow> feed(const std::vector<float>& samples);

    // Emits whatever is buffered as a final window (nullopt when empty) and clears.
    std::optional<AudioWindow> flush();

    void reset();

    size_t bufferedSamples() const {
        return buffer_.size();
    }
    uint64_t processedSamples() const {
        return processedSamples_;
    }
    size_t chunkSamples() const {
        return chunkSamples_;
    }
    size_t overlapSamples() const {
        return overlapSamples_;
    }
    size_t silenceSamples() const {
        return silenceSamples_;
    }
    const WindowerConfig& config() const {
        return config_;
    }

   private:
    AudioWindow makeWindow(std::vector<float> samples, WindowReason reason) const;

    WindowerConfig config_;
    std::optional<AudioSourceTag> source_;
    size_t chunkSamples_;
    size_t overlapSamples_;
    size_t silenceSamples_;

    std::vector<float> buffer_;
    uint64_t processedSamples_ = 0;
};

}  // namespace AudioUtils
