#include "collabscribe/core/transcription_segment.hpp"

namespace collabscribe {
namespace core {

bool operator==(const TranscriptionSegment& a, const TranscriptionSegment& b) {
    return a.id == b.id &&
           a.participantId == b.participantId &&
           a.participantName == b.participantName &&
           a.content == b.content &&
           a.startTime == b.startTime &&
           a.endTime == b.endTime &&
           a.confidence == b.confidence &&
           a.isFinal == b.isFinal &&
           a.language == b.language &&
           a.createdAt == b.createdAt &&
           a.sessionId == b.sessionId;
}

bool operator!=(const TranscriptionSegment& a, const TranscriptionSegment& b) {
    return !(a == b);
}

} // namespace core
} // namespace collabscribe
