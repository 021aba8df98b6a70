#include "capture/pcm_convert.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace capture {

PcmFormat parsePcmFormat(const std::string& formatStr) {
    std::string lower = formatStr;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "s16_le" || lower == "s16") {
        return PcmFormat::S16_LE;
    }
    if (lower == "s24_3le" || lower == "s24") {
        return PcmFormat::S24_3LE;
    }
    if (lower == "s32_le" || lower == "s32") {
        return PcmFormat::S32_LE;
    }
    return PcmFormat::Unknown;
}

const char* pcmFormatToString(PcmFormat format) {
    switch (format) {
    case PcmFormat::S16_LE:
        return "S16_LE";
    case PcmFormat::S24_3LE:
        return "S24_3LE";
    case PcmFormat::S32_LE:
        return "S32_LE";
    case PcmFormat::Unknown:
        break;
    }
    return "UNKNOWN";
}

size_t pcmBytesPerSample(PcmFormat format) {
    switch (format) {
    case PcmFormat::S16_LE:
        return 2;
    case PcmFormat::S24_3LE:
        return 3;
    case PcmFormat::S32_LE:
        return 4;
    case PcmFormat::Unknown:
        break;
    }
    return 0;
}

bool convertPcmToFloat(const void* src, PcmFormat format, size_t frames, unsigned int channels,
                       std::vector<float>& dst) {
    if (format == PcmFormat::Unknown) {
        return false;
    }
    const size_t samples = frames * static_cast<size_t>(channels);
    dst.resize(samples);
    const auto* in = static_cast<const uint8_t*>(src);

    if (format == PcmFormat::S16_LE) {
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t i = 0; i < samples; ++i) {
            int16_t value;
            std::memcpy(&value, in + i * 2, sizeof(value));
            dst[i] = static_cast<float>(value) * scale;
        }
        return true;
    }

    if (format == PcmFormat::S32_LE) {
        constexpr float scale = 1.0f / 2147483648.0f;
        for (size_t i = 0; i < samples; ++i) {
            int32_t value;
            std::memcpy(&value, in + i * 4, sizeof(value));
            dst[i] = static_cast<float>(value) * scale;
        }
        return true;
    }

    constexpr float scale = 1.0f / 8388608.0f;
    for (size_t i = 0; i < samples; ++i) {
        size_t idx = i * 3;
        int32_t value = static_cast<int32_t>(in[idx]) | (static_cast<int32_t>(in[idx + 1]) << 8) |
                        (static_cast<int32_t>(in[idx + 2]) << 16);
        if (value & 0x00800000) {
            value |= static_cast<int32_t>(0xFF000000);  // sign extend 24-bit
        }
        dst[i] = static_cast<float>(value) * scale;
    }
    return true;
}

}  // namespace capture
