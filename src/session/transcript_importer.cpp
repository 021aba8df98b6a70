#include "session/transcript_importer.h"

#include "core/scribe_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

namespace session {
namespace {

const std::regex& zoomHeaderRegex() {
    static const std::regex re(R"(^\[([^\]]+)\]\s+(\d{2}:\d{2}:\d{2})$)");
    return re;
}

std::string trimSpaces(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, last - first + 1);
}

ImportResult failure(ScribeErrors::ErrorCode code, std::string message) {
    ImportResult result;
    result.code = code;
    result.message = std::move(message);
    return result;
}

}  // namespace

bool parseWallClockTime(const std::string& text, double& seconds) {
    int h = 0;
    int m = 0;
    int s = 0;
    char c1 = 0;
    char c2 = 0;
    std::istringstream in(text);
    if (!(in >> h >> c1 >> m >> c2 >> s) || c1 != ':' || c2 != ':') {
        return false;
    }
    in >> std::ws;
    if (!in.eof()) {
        return false;
    }
    if (h < 0 || h >= 24 || m < 0 || m >= 60 || s < 0 || s >= 60) {
        return false;
    }
    seconds = static_cast<double>(h * 3600 + m * 60 + s);
    return true;
}

TranscriptFormat detectTranscriptFormat(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (std::regex_match(trimSpaces(line), zoomHeaderRegex())) {
            return TranscriptFormat::Zoom;
        }
    }
    return TranscriptFormat::Unknown;
}

ImportResult importZoomTranscript(const std::string& content) {
    if (content.empty()) {
        return failure(ScribeErrors::ErrorCode::VALIDATION_EMPTY_CONTENT,
                       "Transcript file is empty");
    }

    std::vector<std::string> lines;
    {
        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(trimSpaces(line));
        }
    }

    ImportResult result;
    bool haveReference = false;
    double reference = 0.0;
    const auto importedAt = std::chrono::system_clock::now();

    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (line.empty()) {
            ++i;
            continue;
        }

        std::smatch match;
        if (!std::regex_match(line, match, zoomHeaderRegex())) {
            LOG_DEBUG("[Importer] Skipping unrecognized line: {}", line);
            ++i;
            continue;
        }

        const std::string speaker = match[1].str();
        double wallClock = 0.0;
        if (!parseWallClockTime(match[2].str(), wallClock)) {
            LOG_WARN("[Importer] Invalid timestamp '{}'", match[2].str());
            ++i;
            continue;
        }
        if (!haveReference) {
            reference = wallClock;
            haveReference = true;
        }
        const double start = wallClock - reference;

        ++i;
        std::string dialogue;
        while (i < lines.size() && !lines[i].empty() &&
               !std::regex_match(lines[i], zoomHeaderRegex())) {
            if (!dialogue.empty()) {
                dialogue += ' ';
            }
            dialogue += lines[i];
            ++i;
        }

        if (dialogue.empty()) {
            continue;
        }

        TranscriptSegment segment;
        segment.text = std::move(dialogue);
        segment.startTime = start;
        segment.endTime = start + ScribeConstants::IMPORTED_LAST_SEGMENT_SECONDS;
        segment.capturedAt = importedAt;
        segment.source = AudioSourceTag::SystemAudio;
        segment.speakerLabel = speaker;
        result.segments.push_back(std::move(segment));
    }

    for (size_t k = 0; k + 1 < result.segments.size(); ++k) {
        result.segments[k].endTime =
            std::max(result.segments[k].startTime, result.segments[k + 1].startTime);
    }

    if (result.segments.empty()) {
        return failure(ScribeErrors::ErrorCode::VALIDATION_INVALID_TRANSCRIPT,
                       "Unrecognized transcript format - expected Zoom format with "
                       "[Speaker Name] HH:MM:SS");
    }

    LOG_INFO("[Importer] Imported {} segment(s)", result.segments.size());
    return result;
}

ImportResult importTranscriptFile(const std::string& filePath) {
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec) || ec) {
        return failure(ScribeErrors::ErrorCode::VALIDATION_FILE_NOT_FOUND,
                       "Transcript file not found: " + filePath);
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return failure(ScribeErrors::ErrorCode::VALIDATION_FILE_NOT_FOUND,
                       "Cannot open transcript file: " + filePath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return importZoomTranscript(buffer.str());
}

}  // namespace session
