#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace capture {

enum class PcmFormat { S16_LE, S24_3LE, S32_LE, Unknown };

// "S16_LE"/"s16", "S24_3LE"/"s24", "S32_LE"/"s32" (case-insensitive)
PcmFormat parsePcmFormat(const std::string& formatStr);

const char* pcmFormatToString(PcmFormat format);

// Bytes per sample of one channel; 0 for Unknown
size_t pcmBytesPerSample(PcmFormat format);

// Interleaved integer PCM -> interleaved float in [-1, 1). dst is resized to
// frames * channels. Returns false for Unknown.
bool convertPcmToFloat(const void* src, PcmFormat format, size_t frames, unsigned int channels,
                       std::vector<float>& dst);

}  // namespace capture
