#include "collabscribe/core/transcription_events.hpp"

namespace collabscribe {
namespace core {

std::string eventTypeToString(TranscriptionEventType type) {
    switch (type) {
        case TranscriptionEventType::SEGMENT_STARTED: return "segment_started";
        case TranscriptionEventType::SEGMENT_UPDATED: return "segment_updated";
        case TranscriptionEventType::SEGMENT_FINALIZED: return "segment_finalized";
        case TranscriptionEventType::SPEAKER_IDENTIFIED: return "speaker_identified";
        case TranscriptionEventType::TRANSCRIPTION_PAUSED: return "transcription_paused";
        case TranscriptionEventType::TRANSCRIPTION_RESUMED: return "transcription_resumed";
        case TranscriptionEventType::QUALITY_CHANGED: return "quality_changed";
        case TranscriptionEventType::SESSION_SUMMARY_GENERATED: return "session_summary_generated";
    }
    return "unknown";
}

} // namespace core
} // namespace collabscribe
