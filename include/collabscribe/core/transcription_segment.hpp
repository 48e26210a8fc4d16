#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

/**
 * One attributed span of transcribed speech. Interim segments (isFinal == false)
 * may be replaced; final segments are immutable once committed to the ledger.
 */
struct TranscriptionSegment {
    std::string id;
    std::string participantId;
    std::string participantName;
    std::string content;

    // Session-relative seconds, endTime >= startTime
    double startTime;
    double endTime;

    float confidence;
    bool isFinal;
    std::string language;
    std::chrono::system_clock::time_point createdAt;
    std::string sessionId;

    TranscriptionSegment()
        : startTime(0.0)
        , endTime(0.0)
        , confidence(0.0f)
        , isFinal(false)
        , language("en-US") {}

    double duration() const { return endTime - startTime; }
};

bool operator==(const TranscriptionSegment& a, const TranscriptionSegment& b);
bool operator!=(const TranscriptionSegment& a, const TranscriptionSegment& b);

/**
 * Participant entry of a collaboration session roster
 */
struct SessionParticipant {
    std::string participantId;
    std::string displayName;
};

/**
 * Session context handed over by the roster/transport collaborator
 */
struct SessionContext {
    std::string sessionId;
    std::string roomName;
    std::string localParticipantId;
    std::vector<SessionParticipant> participants;
};

} // namespace core
} // namespace collabscribe
