#include "session/segment_store.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace session {

std::string formatTimestamp(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }
    const long total = static_cast<long>(std::floor(seconds));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}

void SegmentStore::append(TranscriptSegment segment) {
    segments_.push_back(std::move(segment));
}

void SegmentStore::clear() {
    segments_.clear();
}

std::string SegmentStore::fullTranscript() const {
    return session::fullTranscript(segments_);
}

std::string SegmentStore::timestampedTranscript() const {
    return session::timestampedTranscript(segments_);
}

void SegmentStore::sortByCapturedAt() {
    std::stable_sort(segments_.begin(), segments_.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) {
                         return a.capturedAt < b.capturedAt;
                     });
}

std::string fullTranscript(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        if (!out.empty()) {
            out += ' ';
        }
        out += seg.text;
    }
    return out;
}

std::string timestampedTranscript(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += '[';
        out += formatTimestamp(segments[i].startTime);
        out += "] ";
        out += segments[i].text;
    }
    return out;
}

}  // namespace session
