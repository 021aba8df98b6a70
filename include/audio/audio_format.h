#ifndef LIVE_SCRIBE_AUDIO_FORMAT_H
#define LIVE_SCRIBE_AUDIO_FORMAT_H

#include <cstddef>
#include <string>

namespace AudioUtils {

enum class AudioSourceTag { Microphone, SystemAudio };

// Rate/channel layout announced by a capture source with each interleaved buffer
struct AudioFormat {
    int sampleRate = 0;
    int channels = 0;

    bool valid() const {
        return sampleRate > 0 && channels > 0;
    }
};

inline const char* sourceTagToString(AudioSourceTag tag) {
    switch (tag) {
    case AudioSourceTag::Microphone:
        return "microphone";
    case AudioSourceTag::SystemAudio:
        return "system";
    }
    return "unknown";
}

// Accepts "microphone"/"mic" and "system"/"system_audio"; false for anything else
inline bool parseSourceTag(const std::string& str, AudioSourceTag& out) {
    if (str == "microphone" || str == "mic") {
        out = AudioSourceTag::Microphone;
        return true;
    }
    if (str == "system" || str == "system_audio") {
        out = AudioSourceTag::SystemAudio;
        return true;
    }
    return false;
}

constexpr std::size_t kSourceTagCount = 2;

inline std::size_t sourceTagIndex(AudioSourceTag tag) {
    return tag == AudioSourceTag::Microphone ? 0 : 1;
}

}  // namespace AudioUtils

#endif  // LIVE_SCRIBE_AUDIO_FORMAT_H
