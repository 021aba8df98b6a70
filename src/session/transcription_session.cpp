#include "session/transcription_session.h"

#include "audio/audio_utils.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <utility>

namespace session {

using AudioUtils::AudioWindow;
using transcription::TranscriptionResult;

TranscriptionSession::TranscriptionSession(const AppConfig::SessionConfig& config,
                                           BackendFactory factory, double maxQueuedSeconds)
    : config_(config),
      factory_(std::move(factory)),
      maxQueuedSeconds_(maxQueuedSeconds > 0.0 ? maxQueuedSeconds
                                               : ScribeConstants::DEFAULT_MAX_QUEUED_SECONDS),
      feedBlockSamples_(std::max<size_t>(
          1, static_cast<size_t>(std::llround(config.silenceSeconds *
                                              ScribeConstants::TARGET_SAMPLE_RATE)))) {
    if (!validateSessionConfig(config_, true)) {
        LOG_WARN("[Session] Invalid session config, using defaults");
        config_ = AppConfig::SessionConfig{};
        feedBlockSamples_ = static_cast<size_t>(std::llround(
            ScribeConstants::DEFAULT_SILENCE_SECONDS * ScribeConstants::TARGET_SAMPLE_RATE));
    }
}

TranscriptionSession::~TranscriptionSession() {
    if (state() == SessionState::Recording) {
        stop();
    }
    if (pipelineThread_.joinable()) {
        pipelineThread_.join();
    }
}

bool TranscriptionSession::mixing() const {
    return config_.dualSource && config_.dualSourceStrategy == DualSourceStrategy::Mix;
}

bool TranscriptionSession::acceptsSource(AudioSourceTag source) const {
    return config_.dualSource || source == config_.singleSource;
}

TranscriptionSession::Stream* TranscriptionSession::streamFor(AudioSourceTag source) {
    if (streams_.size() == 1) {
        return streams_.front().get();
    }
    for (auto& stream : streams_) {
        if (stream->tag && *stream->tag == source) {
            return stream.get();
        }
    }
    return nullptr;
}

void TranscriptionSession::setWindowObserver(WindowObserver observer) {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (state() != SessionState::Idle) {
        LOG_WARN("[Session] Window observer can only be changed while idle");
        return;
    }
    windowObserver_ = std::move(observer);
}

bool TranscriptionSession::start() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (state() != SessionState::Idle) {
        LOG_DEBUG("[Session] start() ignored (state: {})", sessionStateToString(state()));
        return false;
    }
    if (pipelineThread_.joinable()) {
        pipelineThread_.join();
    }

    buffersAccepted_ = 0;
    buffersDropped_ = 0;
    samplesProcessed_ = 0;
    windowsEmitted_ = 0;
    windowsTranscribed_ = 0;
    windowsFailed_ = 0;
    emptyResults_ = 0;
    zeroFilledMicrophone_ = 0;
    zeroFilledSystem_ = 0;
    aborted_ = false;
    {
        std::lock_guard<std::mutex> lock(segmentsMutex_);
        store_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.clear();
        queuedSeconds_ = 0.0;
        finalizeRequested_ = false;
    }

    AudioUtils::WindowerConfig windowerConfig;
    windowerConfig.sampleRate = ScribeConstants::TARGET_SAMPLE_RATE;
    windowerConfig.chunkSeconds = config_.chunkSeconds;
    windowerConfig.overlapSeconds = config_.overlapSeconds;
    windowerConfig.silenceThreshold = config_.silenceThreshold;
    windowerConfig.silenceSeconds = config_.silenceSeconds;

    streams_.clear();
    mixer_.reset();
    if (!config_.dualSource) {
        streams_.push_back(std::make_unique<Stream>(config_.singleSource, windowerConfig));
    } else if (mixing()) {
        streams_.push_back(std::make_unique<Stream>(std::nullopt, windowerConfig));
        AudioUtils::MixerConfig mixerConfig;
        mixerConfig.sampleRate = ScribeConstants::TARGET_SAMPLE_RATE;
        mixerConfig.blockSeconds = config_.mixBlockSeconds;
        mixerConfig.maxLagSeconds = config_.maxLagSeconds;
        mixerConfig.systemWeight = config_.systemWeight;
        mixerConfig.microphoneWeight = config_.microphoneWeight;
        // Windows are normalized before transcription; keeping block gain lets
        // the windower see real silence
        mixerConfig.normalizeOutput = false;
        mixer_ = std::make_unique<AudioUtils::StreamMixer>(mixerConfig);
    } else {
        streams_.push_back(
            std::make_unique<Stream>(AudioSourceTag::Microphone, windowerConfig));
        streams_.push_back(
            std::make_unique<Stream>(AudioSourceTag::SystemAudio, windowerConfig));
    }

    for (auto& stream : streams_) {
        std::unique_ptr<transcription::TranscriptionBackend> backend;
        if (factory_) {
            backend = factory_(stream->tag);
        }
        if (!backend) {
            LOG_ERROR("[Session] No transcription backend for {} stream ({})",
                      stream->tag ? AudioUtils::sourceTagToString(*stream->tag) : "mixed",
                      ScribeErrors::errorCodeToString(
                          ScribeErrors::ErrorCode::TRANSCRIPTION_BACKEND_UNAVAILABLE));
            streams_.clear();
            mixer_.reset();
            return false;
        }
        std::string name = stream->tag ? AudioUtils::sourceTagToString(*stream->tag) : "mixed";
        stream->worker = std::make_unique<transcription::TranscriptionWorker>(
            std::move(name), std::move(backend),
            [this](const AudioWindow& window) { onWindowBegin(window); },
            [this](const AudioWindow& window, const TranscriptionResult& result) {
                onWindowResult(window, result);
            });
    }

    state_.store(SessionState::Recording, std::memory_order_release);
    for (auto& stream : streams_) {
        stream->worker->start();
    }
    pipelineThread_ = std::thread([this]() { pipelineLoop(); });

    LOG_INFO("[Session] Recording started ({} stream(s), {}, chunk={}s overlap={}s)",
             streams_.size(),
             !config_.dualSource ? "single source"
                                 : dualSourceStrategyToString(config_.dualSourceStrategy),
             config_.chunkSeconds, config_.overlapSeconds);
    publishStatus(status::kRecording);
    return true;
}

std::vector<TranscriptSegment> TranscriptionSession::stop() {
    std::lock_guard<std::mutex> control(controlMutex_);
    // Compare-exchange: the pipeline worker may be finalizing an aborted session on its own
    SessionState expected = SessionState::Recording;
    if (!state_.compare_exchange_strong(expected, SessionState::Finalizing,
                                        std::memory_order_acq_rel)) {
        LOG_DEBUG("[Session] stop() ignored (state: {})", sessionStateToString(expected));
        return {};
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        finalizeRequested_ = true;
    }
    queueCv_.notify_all();
    if (pipelineThread_.joinable()) {
        pipelineThread_.join();
    }

    stopWorkers();
    std::vector<TranscriptSegment> snapshot = segments();
    streams_.clear();
    mixer_.reset();

    if (!aborted_.load(std::memory_order_acquire)) {
        publishStatus(status::kComplete);
    }
    state_.store(SessionState::Idle, std::memory_order_release);
    return snapshot;
}

// Waits for every queued window, then orders the merged streams
void TranscriptionSession::stopWorkers() {
    for (auto& stream : streams_) {
        if (stream->worker) {
            stream->worker->stop();
        }
    }
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(segmentsMutex_);
        if (streams_.size() > 1) {
            store_.sortByCapturedAt();
        }
        count = store_.size();
    }
    LOG_INFO("[Session] Finalized: {} segment(s), {} window(s), {} failed, {} empty, {} dropped",
             count, windowsEmitted_.load(), windowsFailed_.load(), emptyResults_.load(),
             buffersDropped_.load());
}

bool TranscriptionSession::feed(AudioSourceTag source, const float* interleaved, size_t frames,
                                const AudioFormat& format) {
    if (state() != SessionState::Recording || !acceptsSource(source)) {
        return false;
    }
    if (!format.valid()) {
        LOG_EVERY_N(WARN, 100, "[Session] Dropping {} buffer with invalid format ({} Hz, {} ch)",
                    AudioUtils::sourceTagToString(source), format.sampleRate, format.channels);
        return false;
    }
    if (!interleaved || frames == 0) {
        return false;
    }

    CaptureBuffer buffer;
    buffer.source = source;
    buffer.format = format;
    buffer.samples.assign(interleaved,
                          interleaved + frames * static_cast<size_t>(format.channels));
    buffer.seconds = static_cast<double>(frames) / static_cast<double>(format.sampleRate);
    return enqueue(std::move(buffer));
}

bool TranscriptionSession::feed(AudioSourceTag source, std::vector<float> samples16kMono) {
    if (state() != SessionState::Recording || !acceptsSource(source)) {
        return false;
    }
    if (samples16kMono.empty()) {
        return false;
    }

    CaptureBuffer buffer;
    buffer.source = source;
    buffer.format = AudioFormat{ScribeConstants::TARGET_SAMPLE_RATE, 1};
    buffer.seconds = static_cast<double>(samples16kMono.size()) /
                     static_cast<double>(ScribeConstants::TARGET_SAMPLE_RATE);
    buffer.samples = std::move(samples16kMono);
    return enqueue(std::move(buffer));
}

bool TranscriptionSession::enqueue(CaptureBuffer buffer) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (finalizeRequested_ || aborted_.load(std::memory_order_acquire)) {
            return false;
        }
        if (queuedSeconds_ + buffer.seconds > maxQueuedSeconds_) {
            buffersDropped_.fetch_add(1, std::memory_order_relaxed);
            LOG_EVERY_N(WARN, 100, "[Session] Capture queue full ({:.1f}s queued), dropping {} buffer ({})",
                        queuedSeconds_, AudioUtils::sourceTagToString(buffer.source),
                        ScribeErrors::errorCodeToString(
                            ScribeErrors::ErrorCode::AUDIO_CAPTURE_OVERFLOW));
            return false;
        }
        queuedSeconds_ += buffer.seconds;
        queue_.push_back(std::move(buffer));
    }
    buffersAccepted_.fetch_add(1, std::memory_order_relaxed);
    queueCv_.notify_one();
    return true;
}

void TranscriptionSession::pipelineLoop() {
    try {
        while (true) {
            std::deque<CaptureBuffer> batch;
            bool finalize = false;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                queueCv_.wait(lock, [this]() { return finalizeRequested_ || !queue_.empty(); });
                batch.swap(queue_);
                queuedSeconds_ = 0.0;
                finalize = finalizeRequested_;
            }

            for (auto& buffer : batch) {
                processBuffer(buffer);
            }

            if (finalize) {
                break;
            }
        }
        finalizePipeline();
    } catch (const std::bad_alloc& e) {
        abortPipeline(e.what());
    } catch (const std::exception& e) {
        abortPipeline(e.what());
    }
}

void TranscriptionSession::abortPipeline(const char* what) {
    LOG_CRITICAL("[Session] Pipeline worker failed ({}): {}",
                 ScribeErrors::errorCodeToString(
                     ScribeErrors::ErrorCode::INTERNAL_RESOURCE_EXHAUSTED),
                 what);
    aborted_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.clear();
        queuedSeconds_ = 0.0;
    }
    const std::string message = std::string(status::kAbortedPrefix) + what;

    // stop() already owns finalization when the failure happened during its flush
    SessionState expected = SessionState::Recording;
    if (!state_.compare_exchange_strong(expected, SessionState::Finalizing,
                                        std::memory_order_acq_rel)) {
        publishStatus(message);
        return;
    }

    try {
        finalizePipeline();
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Flush after abort failed, buffered audio lost: {}", e.what());
    }
    stopWorkers();
    publishStatus(message);
    state_.store(SessionState::Idle, std::memory_order_release);
}

void TranscriptionSession::processBuffer(CaptureBuffer& buffer) {
    std::vector<float> converted;
    if (buffer.format.sampleRate == ScribeConstants::TARGET_SAMPLE_RATE &&
        buffer.format.channels == 1) {
        converted = std::move(buffer.samples);
    } else {
        const size_t frames = buffer.samples.size() / static_cast<size_t>(buffer.format.channels);
        converted = AudioUtils::convertToTarget(buffer.samples.data(), frames,
                                                buffer.format.sampleRate,
                                                buffer.format.channels);
    }
    if (converted.empty()) {
        return;
    }
    samplesProcessed_.fetch_add(converted.size(), std::memory_order_relaxed);

    if (mixer_) {
        std::vector<float> mixed = mixer_->push(buffer.source, converted);
        zeroFilledMicrophone_.store(mixer_->zeroFilledSamples(AudioSourceTag::Microphone),
                                    std::memory_order_relaxed);
        zeroFilledSystem_.store(mixer_->zeroFilledSamples(AudioSourceTag::SystemAudio),
                                std::memory_order_relaxed);
        if (!mixed.empty()) {
            stageSamples(*streams_.front(), mixed);
        }
        return;
    }

    Stream* stream = streamFor(buffer.source);
    if (stream) {
        stageSamples(*stream, converted);
    }
}

// Windowers are fed in blocks of silenceSeconds so the trailing-silence check
// sees a full silence span regardless of capture period size.
void TranscriptionSession::stageSamples(Stream& stream, const std::vector<float>& samples) {
    stream.staging.insert(stream.staging.end(), samples.begin(), samples.end());
    while (stream.staging.size() >= feedBlockSamples_) {
        std::vector<float> block(stream.staging.begin(),
                                 stream.staging.begin() +
                                     static_cast<std::ptrdiff_t>(feedBlockSamples_));
        stream.staging.erase(stream.staging.begin(),
                             stream.staging.begin() +
                                 static_cast<std::ptrdiff_t>(feedBlockSamples_));
        submitWindows(stream, stream.windower.feed(block));
    }
}

void TranscriptionSession::finalizePipeline() {
    if (mixer_) {
        std::vector<float> mixed = mixer_->flush();
        zeroFilledMicrophone_.store(mixer_->zeroFilledSamples(AudioSourceTag::Microphone),
                                    std::memory_order_relaxed);
        zeroFilledSystem_.store(mixer_->zeroFilledSamples(AudioSourceTag::SystemAudio),
                                std::memory_order_relaxed);
        if (!mixed.empty()) {
            stageSamples(*streams_.front(), mixed);
        }
    }

    for (auto& stream : streams_) {
        if (!stream->staging.empty()) {
            std::vector<float> rest;
            rest.swap(stream->staging);
            submitWindows(*stream, stream->windower.feed(rest));
        }
        auto last = stream->windower.flush();
        if (last) {
            std::vector<AudioWindow> windows;
            windows.push_back(std::move(*last));
            submitWindows(*stream, std::move(windows));
        }
    }
}

void TranscriptionSession::submitWindows(Stream& stream, std::vector<AudioWindow> windows) {
    for (auto& window : windows) {
        AudioUtils::peakNormalize(window.samples);
        windowsEmitted_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("[Session] {} window {:.2f}s-{:.2f}s ({} samples)",
                  stream.tag ? AudioUtils::sourceTagToString(*stream.tag) : "mixed",
                  window.startTime, window.endTime, window.samples.size());
        if (windowObserver_) {
            windowObserver_(window);
        }
        if (!stream.worker || !stream.worker->submit(std::move(window))) {
            LOG_WARN("[Session] Transcription worker unavailable, window dropped");
        }
    }
}

void TranscriptionSession::onWindowBegin(const AudioWindow& /*window*/) {
    publishStatus(status::kTranscribing);
}

void TranscriptionSession::onWindowResult(const AudioWindow& window,
                                          const TranscriptionResult& result) {
    if (!result.ok()) {
        windowsFailed_.fetch_add(1, std::memory_order_relaxed);
        std::string detail = result.message.empty()
                                 ? std::string(transcription::statusToString(result.status))
                                 : result.message;
        LOG_WARN("[Session] Transcription failed for {:.2f}s-{:.2f}s ({}): {}", window.startTime,
                 window.endTime,
                 ScribeErrors::errorCodeToString(ScribeErrors::ErrorCode::TRANSCRIPTION_FAILED),
                 detail);
        publishStatus(status::kErrorPrefix + detail);
        return;
    }

    std::string text = transcription::trimWhitespace(result.text);
    if (text.empty()) {
        emptyResults_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("[Session] Empty transcription for {:.2f}s-{:.2f}s", window.startTime,
                  window.endTime);
        return;
    }

    TranscriptSegment segment;
    segment.text = std::move(text);
    segment.startTime = window.startTime;
    segment.endTime = window.endTime;
    segment.capturedAt = std::chrono::system_clock::now();
    segment.source = window.source;

    windowsTranscribed_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("[Session] [{:.1f}s - {:.1f}s] {}", segment.startTime, segment.endTime,
             segment.text);
    {
        std::lock_guard<std::mutex> order(publishMutex_);
        {
            std::lock_guard<std::mutex> lock(segmentsMutex_);
            store_.append(segment);
        }
        events_.publish(segment);
    }
    publishStatus(status::kRecording);
}

void TranscriptionSession::publishStatus(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        lastStatus_ = message;
    }
    std::lock_guard<std::mutex> order(publishMutex_);
    events_.publish(StatusEvent{message, state()});
}

std::vector<TranscriptSegment> TranscriptionSession::segments() const {
    std::lock_guard<std::mutex> lock(segmentsMutex_);
    return store_.segments();
}

std::string TranscriptionSession::fullTranscript() const {
    std::lock_guard<std::mutex> lock(segmentsMutex_);
    return store_.fullTranscript();
}

std::string TranscriptionSession::timestampedTranscript() const {
    std::lock_guard<std::mutex> lock(segmentsMutex_);
    return store_.timestampedTranscript();
}

std::string TranscriptionSession::lastStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastStatus_;
}

SessionStats TranscriptionSession::stats() const {
    SessionStats s;
    s.buffersAccepted = buffersAccepted_.load(std::memory_order_relaxed);
    s.buffersDropped = buffersDropped_.load(std::memory_order_relaxed);
    s.samplesProcessed = samplesProcessed_.load(std::memory_order_relaxed);
    s.windowsEmitted = windowsEmitted_.load(std::memory_order_relaxed);
    s.windowsTranscribed = windowsTranscribed_.load(std::memory_order_relaxed);
    s.windowsFailed = windowsFailed_.load(std::memory_order_relaxed);
    s.emptyResults = emptyResults_.load(std::memory_order_relaxed);
    s.zeroFilledMicrophone = zeroFilledMicrophone_.load(std::memory_order_relaxed);
    s.zeroFilledSystem = zeroFilledSystem_.load(std::memory_order_relaxed);
    s.aborted = aborted_.load(std::memory_order_acquire);
    return s;
}

}  // namespace session
