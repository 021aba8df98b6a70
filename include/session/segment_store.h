#pragma once

#include "session/transcript_segment.h"

#include <cstddef>
#include <string>
#include <vector>

namespace session {

// "MM:SS" (minutes are not wrapped at 60). Negative input clamps to 00:00.
std::string formatTimestamp(double seconds);

// Insertion-ordered, append-only log of one session's segments.
// Not synchronized; TranscriptionSession guards it with its own mutex.
class SegmentStore {
   public:
    void append(TranscriptSegment segment);
    void clear();

    const std::vector<TranscriptSegment>& segments() const {
        return segments_;
    }
    size_t size() const {
        return segments_.size();
    }
    bool empty() const {
        return segments_.empty();
    }

    // Segment texts joined by a single space
    std::string fullTranscript() const;

    // One "[MM:SS] text" line per segment, joined by '\n'
    std::string timestampedTranscript() const;

    // Stable sort by capturedAt (merges independently transcribed streams)
    void sortByCapturedAt();

   private:
    std::vector<TranscriptSegment> segments_;
};

std::string fullTranscript(const std::vector<TranscriptSegment>& segments);
std::string timestampedTranscript(const std::vector<TranscriptSegment>& segments);

}  // namespace session
