#ifndef LIVE_SCRIBE_WAV_FILE_SOURCE_H
#define LIVE_SCRIBE_WAV_FILE_SOURCE_H

#include "capture/audio_source.h"

#include <atomic>
#include <mutex>
#include <sndfile.h>
#include <string>
#include <thread>

namespace capture {

// Thin RAII wrapper over a libsndfile read handle
class SoundFileReader {
   public:
    SoundFileReader();
    ~SoundFileReader();

    SoundFileReader(const SoundFileReader&) = delete;
    SoundFileReader& operator=(const SoundFileReader&) = delete;

    bool open(const std::string& filename);
    void close();

    bool isOpen() const {
        return file_ != nullptr;
    }
    int sampleRate() const {
        return info_.samplerate;
    }
    int channels() const {
        return info_.channels;
    }
    sf_count_t frames() const {
        return info_.frames;
    }

    // Returns frames read (0 at end of file, -1 on error)
    sf_count_t readBlock(float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

// Plays a sound file into the pipeline as if it were a capture device.
// blockFrames per callback; with realtime pacing the thread sleeps for each
// block's duration, otherwise the file is pushed as fast as the callback returns.
class WavFileSource final : public AudioSource {
   public:
    WavFileSource(AudioSourceTag tag, std::string path, size_t blockFrames = 1024,
                  bool realtime = false);
    ~WavFileSource() override;

    WavFileSource(const WavFileSource&) = delete;
    WavFileSource& operator=(const WavFileSource&) = delete;

    const char* name() const override {
        return "file";
    }
    AudioSourceTag tag() const override {
        return tag_;
    }

    bool start(SampleCallback callback) override;
    void stop() override;

    bool running() const override {
        return running_.load(std::memory_order_acquire);
    }
    bool finished() const override {
        return finished_.load(std::memory_order_acquire);
    }

    // Blocks until the whole file has been delivered (or stop() was called)
    void waitUntilFinished();

    const std::string& path() const {
        return path_;
    }

   private:
    void playLoop(SampleCallback callback);

    AudioSourceTag tag_;
    std::string path_;
    size_t blockFrames_;
    bool realtime_;
    SoundFileReader reader_;

    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::mutex threadMutex_;
    std::thread thread_;
};

}  // namespace capture

#endif  // LIVE_SCRIBE_WAV_FILE_SOURCE_H
