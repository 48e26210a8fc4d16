#pragma once

#include "collabscribe/core/transcription_segment.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <string>

namespace collabscribe {
namespace core {

enum class TranscriptionEventType {
    SEGMENT_STARTED,
    SEGMENT_UPDATED,
    SEGMENT_FINALIZED,
    SPEAKER_IDENTIFIED,
    TRANSCRIPTION_PAUSED,
    TRANSCRIPTION_RESUMED,
    QUALITY_CHANGED,
    SESSION_SUMMARY_GENERATED
};

std::string eventTypeToString(TranscriptionEventType type);

/**
 * Discrete notification emitted by the session coordinator. Only the members
 * relevant to the event type are populated.
 */
struct TranscriptionEvent {
    TranscriptionEventType type;
    std::string sessionId;
    std::string participantId;

    // SEGMENT_*
    TranscriptionSegment segment;

    // SPEAKER_IDENTIFIED
    std::string speakerId;
    float speakerConfidence;

    // QUALITY_CHANGED ("excellent", "good", "fair", "poor")
    std::string previousQuality;
    std::string quality;

    // SESSION_SUMMARY_GENERATED, serialized summary
    std::string summaryJson;

    explicit TranscriptionEvent(TranscriptionEventType eventType)
        : type(eventType), speakerConfidence(0.0f) {}
};

using TranscriptionEventCallback = std::function<void(const TranscriptionEvent&)>;

/**
 * Counters of ingestion inputs that were dropped, clamped or repaired.
 * None of these conditions is fatal.
 */
struct IngestionDiagnostics {
    std::atomic<size_t> unknownParticipantEvents{0};
    std::atomic<size_t> micDisabledEvents{0};
    std::atomic<size_t> inactiveSessionEvents{0};
    std::atomic<size_t> emptyEvents{0};
    std::atomic<size_t> clampedValues{0};
    std::atomic<size_t> rejectedAudioSamples{0};
    std::atomic<size_t> stopInconsistencies{0};
    std::atomic<size_t> rejectedRemoteSegments{0};

    void reset() {
        unknownParticipantEvents = 0;
        micDisabledEvents = 0;
        inactiveSessionEvents = 0;
        emptyEvents = 0;
        clampedValues = 0;
        rejectedAudioSamples = 0;
        stopInconsistencies = 0;
        rejectedRemoteSegments = 0;
    }

    std::map<std::string, size_t> snapshot() const {
        return {
            {"unknown_participant_events", unknownParticipantEvents.load()},
            {"mic_disabled_events", micDisabledEvents.load()},
            {"inactive_session_events", inactiveSessionEvents.load()},
            {"empty_events", emptyEvents.load()},
            {"clamped_values", clampedValues.load()},
            {"rejected_audio_samples", rejectedAudioSamples.load()},
            {"stop_inconsistencies", stopInconsistencies.load()},
            {"rejected_remote_segments", rejectedRemoteSegments.load()}
        };
    }
};

} // namespace core
} // namespace collabscribe
