#pragma once

#include "collabscribe/core/participant_registry.hpp"
#include "collabscribe/core/segment_ledger.hpp"
#include "collabscribe/core/session_clock.hpp"
#include "collabscribe/core/transcription_events.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace collabscribe {
namespace core {

/**
 * Turns per-participant partial/final recognition events into interim buffer
 * updates and committed ledger segments.
 *
 * Not synchronized: every method must run on the session loop that owns the
 * registry and the ledger of the session.
 */
class RecognitionEventProcessor {
public:
    /**
     * Receives every segment the processor writes to the ledger.
     * `broadcast` is false for segments that did not originate locally.
     */
    using SegmentPublisher = std::function<void(TranscriptionEventType type,
                                                const TranscriptionSegment& segment,
                                                bool broadcast)>;

    RecognitionEventProcessor(ParticipantRegistry& registry,
                              SegmentLedger& ledger,
                              std::shared_ptr<SessionClock> clock,
                              std::chrono::steady_clock::time_point sessionStart,
                              std::string sessionId,
                              IngestionDiagnostics& diagnostics,
                              std::string language = "en-US");

    void setSegmentPublisher(SegmentPublisher publisher);

    /**
     * Replace the participant's interim buffer with the latest hypothesis.
     * The first partial of an utterance records its start time. Never writes
     * to the ledger. Returns false if the event was dropped.
     */
    bool onPartial(const std::string& participantId, const std::string& text, float confidence);

    /**
     * Commit the utterance as one final segment, clear the buffer and publish
     * SEGMENT_FINALIZED. An empty text finalizes the buffered hypothesis.
     * Returns false if the event was dropped.
     */
    bool onFinal(const std::string& participantId, const std::string& text, float confidence);

    /**
     * Materialize every non-empty buffer of a mic-enabled participant as an
     * interim segment (one flush tick). Returns the number of segments written.
     */
    size_t flushInterim(float interimConfidence);

    /**
     * Force the participant's pending content into exactly one final segment:
     * the buffered text if any, otherwise the ledger's active segment.
     * Used by stop() and by participant departure.
     */
    std::optional<TranscriptionSegment> finalizePending(const std::string& participantId,
                                                        float bufferConfidence);

    /**
     * Session-relative seconds now
     */
    double sessionTime() const;

    const std::string& sessionId() const { return sessionId_; }

private:
    enum class DropReason {
        NONE,
        UNKNOWN_PARTICIPANT,
        MIC_DISABLED
    };

    DropReason checkAccepted(const std::string& participantId) const;

    // Counts a NaN or out-of-range confidence in the diagnostics
    bool countIfOutOfRange(float confidence);
    float sanitizeConfidence(float confidence);

    TranscriptionSegment buildSegment(const ParticipantState& state,
                                      const std::string& segmentId,
                                      const std::string& content,
                                      double startTime,
                                      float confidence,
                                      bool isFinal) const;

    std::optional<TranscriptionSegment> commitUtterance(ParticipantState& state,
                                                        const std::string& content,
                                                        float confidence);

    void publish(TranscriptionEventType type, const TranscriptionSegment& segment, bool broadcast);

    ParticipantRegistry& registry_;
    SegmentLedger& ledger_;
    std::shared_ptr<SessionClock> clock_;
    std::chrono::steady_clock::time_point sessionStart_;
    std::string sessionId_;
    IngestionDiagnostics& diagnostics_;
    std::string language_;
    SegmentPublisher publisher_;
};

} // namespace core
} // namespace collabscribe
