#ifndef LIVE_SCRIBE_CONSTANTS_H
#define LIVE_SCRIBE_CONSTANTS_H

#include <cstddef>

// Constants shared by the pipeline, capture adapters and the control plane

namespace ScribeConstants {

// Every stage downstream of normalization runs at this rate, mono
constexpr int TARGET_SAMPLE_RATE = 16000;

// Peak target after normalization (linear)
constexpr float NORMALIZE_PEAK = 0.9f;

// Chunking defaults
constexpr double DEFAULT_CHUNK_SECONDS = 5.0;
constexpr double DEFAULT_OVERLAP_SECONDS = 1.0;
constexpr float DEFAULT_SILENCE_THRESHOLD = 0.01f;
constexpr double DEFAULT_SILENCE_SECONDS = 2.0;

// Dual-source mixing defaults
constexpr float DEFAULT_SYSTEM_WEIGHT = 0.7f;
constexpr float DEFAULT_MICROPHONE_WEIGHT = 0.8f;
constexpr double DEFAULT_MIX_BLOCK_SECONDS = 1.0;
constexpr double DEFAULT_MAX_LAG_SECONDS = 2.0;

// Capture queue bound (seconds of raw audio across all sources)
constexpr double DEFAULT_MAX_QUEUED_SECONDS = 120.0;

// Imported transcripts: duration assumed for the final segment
constexpr double IMPORTED_LAST_SEGMENT_SECONDS = 3.0;

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/live_scribe.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

}  // namespace ScribeConstants

#endif  // LIVE_SCRIBE_CONSTANTS_H
