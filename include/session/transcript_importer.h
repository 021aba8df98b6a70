#ifndef LIVE_SCRIBE_TRANSCRIPT_IMPORTER_H
#define LIVE_SCRIBE_TRANSCRIPT_IMPORTER_H

#include "core/error_codes.h"
#include "session/transcript_segment.h"

#include <string>
#include <vector>

namespace session {

enum class TranscriptFormat { Zoom, Unknown };

struct ImportResult {
    ScribeErrors::ErrorCode code = ScribeErrors::ErrorCode::OK;
    std::string message;
    std::vector<TranscriptSegment> segments;

    bool ok() const {
        return code == ScribeErrors::ErrorCode::OK;
    }
};

// Zoom export layout:
//
//   [Speaker Name] HH:MM:SS
//   dialogue line
//   more dialogue
//   <blank line>
//
// The first header's time becomes 0.0. Each segment ends where the next one
// starts; the last one gets a fixed 3 s. Segments carry the speaker label and
// are tagged as system audio.
ImportResult importZoomTranscript(const std::string& content);

// Reads filePath and imports it. VALIDATION_FILE_NOT_FOUND, VALIDATION_EMPTY_CONTENT
// or VALIDATION_INVALID_TRANSCRIPT on failure.
ImportResult importTranscriptFile(const std::string& filePath);

TranscriptFormat detectTranscriptFormat(const std::string& content);

// "HH:MM:SS" (24h) -> seconds since midnight; false when malformed or out of range
bool parseWallClockTime(const std::string& text, double& seconds);

}  // namespace session

#endif  // LIVE_SCRIBE_TRANSCRIPT_IMPORTER_H
