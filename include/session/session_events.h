#pragma once

#include "logging/logger.h"
#include "session/transcript_segment.h"

#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace session {

struct StatusEvent {
    std::string message;
    SessionState state = SessionState::Idle;
};

// Fan-out of session events to subscribers. Handlers run on the publishing
// thread, outside the dispatcher lock. A handler that throws is logged and
// skipped; the remaining handlers still run.
class SessionEventDispatcher {
   public:
    using SegmentHandler = std::function<void(const TranscriptSegment&)>;
    using StatusHandler = std::function<void(const StatusEvent&)>;

    void subscribe(const SegmentHandler& handler);
    void subscribe(const StatusHandler& handler);

    void publish(const TranscriptSegment& segment) const;
    void publish(const StatusEvent& event) const;

    void clear();

   private:
    template <typename Event, typename Handler>
    void publishImpl(const Event& event, const std::vector<Handler>& handlers) const;

    mutable std::mutex mutex_;
    std::vector<SegmentHandler> segmentHandlers_;
    std::vector<StatusHandler> statusHandlers_;
};

inline void SessionEventDispatcher::subscribe(const SegmentHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    segmentHandlers_.push_back(handler);
}

inline void SessionEventDispatcher::subscribe(const StatusHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusHandlers_.push_back(handler);
}

inline void SessionEventDispatcher::publish(const TranscriptSegment& segment) const {
    publishImpl(segment, segmentHandlers_);
}

inline void SessionEventDispatcher::publish(const StatusEvent& event) const {
    publishImpl(event, statusHandlers_);
}

inline void SessionEventDispatcher::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    segmentHandlers_.clear();
    statusHandlers_.clear();
}

template <typename Event, typename Handler>
void SessionEventDispatcher::publishImpl(const Event& event,
                                         const std::vector<Handler>& handlers) const {
    std::vector<Handler> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handlers;
    }
    for (const auto& handler : copy) {
        if (!handler) {
            continue;
        }
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("[Session] Event subscriber threw: {}", e.what());
        }
    }
}

}  // namespace session
