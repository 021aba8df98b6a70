#pragma once

#include "audio/audio_format.h"

#include <cstddef>
#include <functional>

namespace capture {

using AudioUtils::AudioFormat;
using AudioUtils::AudioSourceTag;

// Called on the source's own thread with interleaved float PCM. The buffer is
// only valid for the duration of the call; receivers must copy and return fast.
using SampleCallback =
    std::function<void(const float* interleaved, size_t frames, const AudioFormat& format)>;

class AudioSource {
   public:
    virtual ~AudioSource() = default;

    virtual const char* name() const = 0;
    virtual AudioSourceTag tag() const = 0;

    // Starts delivering buffers to callback. False when the device cannot be opened.
    virtual bool start(SampleCallback callback) = 0;

    // Stops delivery and joins the capture thread. Idempotent.
    virtual void stop() = 0;

    virtual bool running() const = 0;

    // True once a finite source (a file) has delivered everything
    virtual bool finished() const {
        return false;
    }
};

}  // namespace capture
