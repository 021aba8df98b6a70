#include "capture/wav_file_source.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

namespace capture {

SoundFileReader::SoundFileReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

SoundFileReader::~SoundFileReader() {
    close();
}

bool SoundFileReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Error opening input file: {} ({})", filename,
                  ScribeErrors::errorCodeToString(ScribeErrors::ErrorCode::AUDIO_FILE_READ_FAILED));
        LOG_ERROR("libsndfile error: {}", sf_strerror(nullptr));
        return false;
    }

    LOG_INFO("Opened: {} ({} Hz, {} ch, {} frames, {:.2f} s)", filename, info_.samplerate,
             info_.channels, static_cast<long long>(info_.frames),
             info_.samplerate > 0 ? static_cast<double>(info_.frames) / info_.samplerate : 0.0);
    return true;
}

void SoundFileReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

sf_count_t SoundFileReader::readBlock(float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("Error: File not opened");
        return -1;
    }
    return sf_readf_float(file_, buffer, frames);
}

WavFileSource::WavFileSource(AudioSourceTag tag, std::string path, size_t blockFrames,
                             bool realtime)
    : tag_(tag), path_(std::move(path)), blockFrames_(std::max<size_t>(1, blockFrames)),
      realtime_(realtime) {}

WavFileSource::~WavFileSource() {
    stop();
}

bool WavFileSource::start(SampleCallback callback) {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (running_.load(std::memory_order_acquire)) {
        return true;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (!reader_.open(path_)) {
        return false;
    }
    if (reader_.sampleRate() <= 0 || reader_.channels() <= 0) {
        LOG_ERROR("[File:{}] Invalid stream parameters in {}", AudioUtils::sourceTagToString(tag_),
                  path_);
        reader_.close();
        return false;
    }

    finished_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(
        [this, cb = std::move(callback)]() mutable { playLoop(std::move(cb)); });
    return true;
}

void WavFileSource::stop() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
    reader_.close();
}

void WavFileSource::waitUntilFinished() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void WavFileSource::playLoop(SampleCallback callback) {
    const AudioFormat format{reader_.sampleRate(), reader_.channels()};
    std::vector<float> block(blockFrames_ * static_cast<size_t>(format.channels));
    const auto blockDuration = std::chrono::microseconds(
        static_cast<int64_t>(1e6 * static_cast<double>(blockFrames_) / format.sampleRate));
    auto next = std::chrono::steady_clock::now();
    size_t delivered = 0;

    while (running_.load(std::memory_order_acquire)) {
        sf_count_t frames = reader_.readBlock(block.data(), static_cast<sf_count_t>(blockFrames_));
        if (frames < 0) {
            LOG_ERROR("[File:{}] Read failed ({})", AudioUtils::sourceTagToString(tag_),
                      ScribeErrors::errorCodeToString(
                          ScribeErrors::ErrorCode::AUDIO_FILE_READ_FAILED));
            break;
        }
        if (frames == 0) {
            break;
        }
        if (callback) {
            callback(block.data(), static_cast<size_t>(frames), format);
        }
        delivered += static_cast<size_t>(frames);

        if (realtime_) {
            next += blockDuration;
            std::this_thread::sleep_until(next);
        }
    }

    LOG_INFO("[File:{}] Delivered {} frames from {}", AudioUtils::sourceTagToString(tag_),
             delivered, path_);
    finished_.store(true, std::memory_order_release);
    running_.store(false, std::memory_order_release);
}

}  // namespace capture
