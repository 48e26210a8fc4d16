#include "collabscribe/core/recognition_event_processor.hpp"
#include "collabscribe/utils/id_generator.hpp"
#include "collabscribe/utils/logging.hpp"
#include "collabscribe/utils/time_format.hpp"
#include <cmath>

namespace collabscribe {
namespace core {

RecognitionEventProcessor::RecognitionEventProcessor(ParticipantRegistry& registry,
                                                     SegmentLedger& ledger,
                                                     std::shared_ptr<SessionClock> clock,
                                                     std::chrono::steady_clock::time_point sessionStart,
                                                     std::string sessionId,
                                                     IngestionDiagnostics& diagnostics,
                                                     std::string language)
    : registry_(registry)
    , ledger_(ledger)
    , clock_(clock ? std::move(clock) : makeSystemClock())
    , sessionStart_(sessionStart)
    , sessionId_(std::move(sessionId))
    , diagnostics_(diagnostics)
    , language_(std::move(language)) {
}

void RecognitionEventProcessor::setSegmentPublisher(SegmentPublisher publisher) {
    publisher_ = std::move(publisher);
}

bool RecognitionEventProcessor::onPartial(const std::string& participantId, const std::string& text, float confidence) {
    DropReason reason = checkAccepted(participantId);
    if (reason != DropReason::NONE) {
        return false;
    }

    // Partials only update the buffer, their confidence is not stored
    if (countIfOutOfRange(confidence)) {
        utils::Logger::debug("Partial confidence out of range for '" + participantId + "'");
    }

    if (text.empty()) {
        diagnostics_.emptyEvents++;
        return false;
    }

    ParticipantState* state = registry_.find(participantId);
    state->interimBuffer = text;
    if (!state->utteranceStartTime) {
        state->utteranceStartTime = sessionTime();
    }
    return true;
}

bool RecognitionEventProcessor::onFinal(const std::string& participantId, const std::string& text, float confidence) {
    DropReason reason = checkAccepted(participantId);
    if (reason != DropReason::NONE) {
        return false;
    }

    float sanitized = sanitizeConfidence(confidence);

    ParticipantState* state = registry_.find(participantId);
    const std::string content = text.empty() ? state->interimBuffer : text;
    if (content.empty()) {
        diagnostics_.emptyEvents++;
        return false;
    }

    return commitUtterance(*state, content, sanitized).has_value();
}

size_t RecognitionEventProcessor::flushInterim(float interimConfidence) {
    float confidence = sanitizeConfidence(interimConfidence);
    size_t written = 0;

    for (const auto& participantId : registry_.participantIds()) {
        ParticipantState* state = registry_.find(participantId);
        if (state == nullptr || !state->micEnabled || state->interimBuffer.empty()) {
            continue;
        }

        if (!state->utteranceStartTime) {
            state->utteranceStartTime = sessionTime();
        }

        bool first = state->activeSegmentId.empty();
        if (first) {
            state->activeSegmentId = utils::generateUuid();
        }

        TranscriptionSegment segment = buildSegment(*state, state->activeSegmentId, state->interimBuffer,
                                                    *state->utteranceStartTime, confidence, false);
        if (!ledger_.replaceActive(participantId, segment)) {
            continue;
        }

        publish(first ? TranscriptionEventType::SEGMENT_STARTED : TranscriptionEventType::SEGMENT_UPDATED,
                segment, true);
        written++;
    }

    return written;
}

std::optional<TranscriptionSegment> RecognitionEventProcessor::finalizePending(const std::string& participantId,
                                                                               float bufferConfidence) {
    ParticipantState* state = registry_.find(participantId);

    if (state != nullptr && !state->interimBuffer.empty()) {
        if (!state->utteranceStartTime) {
            diagnostics_.stopInconsistencies++;
            utils::Logger::warn("Pending buffer of participant '" + participantId +
                                "' has no utterance start time, using current time");
        }
        std::string content = state->interimBuffer;
        return commitUtterance(*state, content, sanitizeConfidence(bufferConfidence));
    }

    auto finalized = ledger_.finalize(participantId);
    if (state != nullptr) {
        state->clearUtterance();
    }
    if (finalized) {
        publish(TranscriptionEventType::SEGMENT_FINALIZED, *finalized, state != nullptr);
    }
    return finalized;
}

double RecognitionEventProcessor::sessionTime() const {
    return clock_->secondsSince(sessionStart_);
}

RecognitionEventProcessor::DropReason RecognitionEventProcessor::checkAccepted(const std::string& participantId) const {
    const ParticipantState* state = registry_.find(participantId);
    if (state == nullptr) {
        diagnostics_.unknownParticipantEvents++;
        utils::Logger::debug("Dropping recognition event for unknown participant '" + participantId + "'");
        return DropReason::UNKNOWN_PARTICIPANT;
    }
    if (!state->micEnabled) {
        diagnostics_.micDisabledEvents++;
        utils::Logger::debug("Dropping recognition event for paused participant '" + participantId + "'");
        return DropReason::MIC_DISABLED;
    }
    return DropReason::NONE;
}

bool RecognitionEventProcessor::countIfOutOfRange(float confidence) {
    if (std::isnan(confidence) || confidence < 0.0f || confidence > 1.0f) {
        diagnostics_.clampedValues++;
        return true;
    }
    return false;
}

float RecognitionEventProcessor::sanitizeConfidence(float confidence) {
    if (!countIfOutOfRange(confidence)) {
        return confidence;
    }
    return confidence > 1.0f ? 1.0f : 0.0f;
}

TranscriptionSegment RecognitionEventProcessor::buildSegment(const ParticipantState& state,
                                                             const std::string& segmentId,
                                                             const std::string& content,
                                                             double startTime,
                                                             float confidence,
                                                             bool isFinal) const {
    TranscriptionSegment segment;
    segment.id = segmentId;
    segment.participantId = state.participantId;
    segment.participantName = state.displayName.empty() ? state.participantId : state.displayName;
    segment.content = content;
    segment.startTime = startTime;

    double now = sessionTime();
    segment.endTime = now < startTime ? startTime : now;

    segment.confidence = confidence;
    segment.isFinal = isFinal;
    segment.language = language_;
    segment.createdAt = utils::truncateToMillis(clock_->wallNow());
    segment.sessionId = sessionId_;
    return segment;
}

std::optional<TranscriptionSegment> RecognitionEventProcessor::commitUtterance(ParticipantState& state,
                                                                               const std::string& content,
                                                                               float confidence) {
    double startTime = state.utteranceStartTime ? *state.utteranceStartTime : sessionTime();

    std::string segmentId = state.activeSegmentId;
    if (segmentId.empty()) {
        auto active = ledger_.activeSegment(state.participantId);
        segmentId = active ? active->id : utils::generateUuid();
    }

    TranscriptionSegment segment = buildSegment(state, segmentId, content, startTime, confidence, true);
    state.clearUtterance();

    if (!ledger_.commitFinal(state.participantId, segment)) {
        utils::Logger::warn("Final segment of participant '" + state.participantId + "' was not committed");
        return std::nullopt;
    }

    publish(TranscriptionEventType::SEGMENT_FINALIZED, segment, true);
    return segment;
}

void RecognitionEventProcessor::publish(TranscriptionEventType type, const TranscriptionSegment& segment, bool broadcast) {
    if (publisher_) {
        publisher_(type, segment, broadcast);
    }
}

} // namespace core
} // namespace collabscribe
