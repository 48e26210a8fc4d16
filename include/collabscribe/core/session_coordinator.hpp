#pragma once

#include "collabscribe/audio/feature_extractor.hpp"
#include "collabscribe/audio/quality_monitor.hpp"
#include "collabscribe/core/buffer_flush_scheduler.hpp"
#include "collabscribe/core/collaborator_interfaces.hpp"
#include "collabscribe/core/participant_registry.hpp"
#include "collabscribe/core/recognition_event_processor.hpp"
#include "collabscribe/core/segment_ledger.hpp"
#include "collabscribe/core/session_clock.hpp"
#include "collabscribe/core/session_summarizer.hpp"
#include "collabscribe/core/task_queue.hpp"
#include "collabscribe/core/transcript_exporter.hpp"
#include "collabscribe/core/transcription_events.hpp"
#include "collabscribe/speaker/speaker_profile_matcher.hpp"
#include "collabscribe/utils/config.hpp"
#include "collabscribe/utils/error_handler.hpp"
#include "collabscribe/utils/logging.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

enum class SessionState {
    IDLE,
    ACTIVE,
    STOPPED
};

std::string sessionStateToString(SessionState state);

enum class TranscriptionError {
    NONE,
    NOT_AUTHORIZED,
    NO_ACTIVE_SESSION,
    AUDIO_PIPELINE_FAILURE,
    SESSION_ALREADY_ACTIVE,
    UNKNOWN_PARTICIPANT
};

std::string transcriptionErrorToString(TranscriptionError error);

struct OperationResult {
    bool success;
    TranscriptionError error;
    std::string message;

    OperationResult() : success(true), error(TranscriptionError::NONE) {}
    OperationResult(TranscriptionError err, std::string msg)
        : success(err == TranscriptionError::NONE), error(err), message(std::move(msg)) {}

    static OperationResult ok() { return OperationResult(); }
};

/**
 * Owns the lifecycle of one collaborative transcription session at a time.
 *
 * Every mutation of the ledger and the participant registry runs as a task on
 * a single serial session loop, so recognition events, flush ticks, roster
 * changes and control operations never interleave. Recognition and roster
 * events are queued and return immediately; control operations wait for their
 * result. Audio samples bypass the loop and go straight to the quality
 * monitor and the speaker matcher.
 *
 * State machine: IDLE -> ACTIVE -> STOPPED, and STOPPED -> ACTIVE for a new
 * session. Public operations never throw.
 */
class SessionCoordinator {
public:
    explicit SessionCoordinator(const utils::TranscriptionConfig& config = utils::TranscriptionConfig{},
                                std::shared_ptr<RecognitionAuthorizer> authorizer = nullptr,
                                std::shared_ptr<AudioIntake> audioIntake = nullptr,
                                std::shared_ptr<TranscriptBroadcaster> broadcaster = nullptr,
                                std::shared_ptr<SessionClock> clock = nullptr);
    ~SessionCoordinator();

    // Non-copyable, non-movable
    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;
    SessionCoordinator(SessionCoordinator&&) = delete;
    SessionCoordinator& operator=(SessionCoordinator&&) = delete;

    void setRecognitionAuthorizer(std::shared_ptr<RecognitionAuthorizer> authorizer);
    void setAudioIntake(std::shared_ptr<AudioIntake> audioIntake);
    void setBroadcaster(std::shared_ptr<TranscriptBroadcaster> broadcaster);
    void setFeatureExtractor(std::shared_ptr<audio::FeatureExtractor> extractor);
    void setEventCallback(TranscriptionEventCallback callback);

    // Lifecycle

    /**
     * Begin a session for the given context. On failure the state is unchanged.
     */
    OperationResult start(const std::optional<SessionContext>& context);

    /**
     * End the active session: stop the flush timer, finalize every pending
     * utterance, stop audio intake, freeze the ledger and generate the summary.
     * No-op unless ACTIVE.
     */
    void stop();

    OperationResult pause(const std::string& participantId);

    /**
     * Re-enable the participant's mic; its interim buffer starts empty
     */
    OperationResult resume(const std::string& participantId);

    // Roster, ignored outside ACTIVE
    void participantJoined(const std::string& participantId, const std::string& displayName);
    void participantLeft(const std::string& participantId);

    // Recognition events (queued)
    void onPartial(const std::string& participantId, const std::string& text, float confidence);
    void onFinal(const std::string& participantId, const std::string& text, float confidence);
    void onRecognitionEvent(const std::string& participantId, const std::string& text,
                            float confidence, bool isFinal);

    /**
     * Store a segment replicated from a remote peer (append semantics).
     * Such segments are never re-broadcast.
     */
    void applyRemoteSegment(const TranscriptionSegment& segment);

    /**
     * Run one flush tick now and wait for it. Returns the number of interim
     * segments written.
     */
    size_t flushInterimBuffers();

    /**
     * Block until every task queued before this call has run
     */
    void waitForIdle();

    // Audio side channels
    void ingestAudioSample(const std::string& participantId, float levelDb,
                           const std::vector<float>& features = {});
    void ingestAudioFrame(const std::string& participantId, const std::vector<float>& samples);
    speaker::SpeakerMatch identifySpeaker(const std::vector<float>& features);

    // Queries
    SessionState getState() const { return state_; }
    std::string getSessionId() const;
    std::shared_ptr<const SegmentLedger> getLedger() const;

    std::vector<TranscriptionSegment> getTranscriptionForParticipant(const std::string& participantId) const;
    std::vector<TranscriptionSegment> getTranscriptionInTimeRange(double startTime, double endTime) const;
    std::vector<TranscriptionSegment> searchTranscription(const std::string& text) const;
    std::vector<TranscriptionSegment> query(const SegmentFilter& filter) const;
    std::string exportTranscript(ExportFormat format) const;

    std::optional<SessionSummary> getSessionSummary() const;

    std::string getInterimBuffer(const std::string& participantId);
    bool isMicEnabled(const std::string& participantId);
    std::vector<ParticipantState> getParticipants();

    const IngestionDiagnostics& getDiagnostics() const { return diagnostics_; }
    audio::QualityTier currentQuality() const { return qualityMonitor_.currentTier(); }
    const audio::QualityMonitor& getQualityMonitor() const { return qualityMonitor_; }
    const speaker::SpeakerProfileMatcher& getSpeakerMatcher() const { return speakerMatcher_; }
    const utils::TranscriptionConfig& getConfig() const { return config_; }

private:
    // Loop-side implementations
    OperationResult doStart(const std::optional<SessionContext>& context);
    void doStop();
    OperationResult doSetMicEnabled(const std::string& participantId, bool enabled);
    void doParticipantJoined(const std::string& participantId, const std::string& displayName);
    void doParticipantLeft(const std::string& participantId);
    void doApplyRemoteSegment(TranscriptionSegment segment);
    size_t doFlush();

    void onSegmentPublished(TranscriptionEventType type, const TranscriptionSegment& segment, bool broadcast);
    void emitEvent(const TranscriptionEvent& event);
    TranscriptionEvent makeEvent(TranscriptionEventType type, const std::string& participantId) const;

    OperationResult failure(TranscriptionError error, const std::string& message,
                            utils::ErrorCategory category = utils::ErrorCategory::SESSION);

    /**
     * Queue a task that only mutates loop-owned state. Dropped with a warning
     * if the loop no longer accepts tasks.
     */
    void post(std::function<void()> task);

    /**
     * Run fn on the session loop and wait for its result. Runs inline when
     * already on the loop. Returns fallback if the task could not run.
     * Errors reported by fn carry the operation name and the session id.
     */
    template<typename T, typename F>
    T runOnLoop(F&& fn, T fallback, const char* operation);

    const utils::TranscriptionConfig config_;
    std::shared_ptr<SessionClock> clock_;

    mutable std::mutex collaboratorMutex_;
    std::shared_ptr<RecognitionAuthorizer> authorizer_;
    std::shared_ptr<AudioIntake> audioIntake_;
    std::shared_ptr<TranscriptBroadcaster> broadcaster_;
    std::shared_ptr<audio::FeatureExtractor> featureExtractor_;

    std::mutex callbackMutex_;
    TranscriptionEventCallback eventCallback_;

    std::shared_ptr<TaskQueue> taskQueue_;
    std::unique_ptr<SerialExecutor> executor_;

    std::atomic<SessionState> state_;

    // Published session data, readable from any thread
    mutable std::mutex sessionMutex_;
    std::string sessionId_;
    std::shared_ptr<SegmentLedger> ledger_;
    std::optional<SessionSummary> summary_;

    // Loop-owned session data
    SessionContext context_;
    std::chrono::steady_clock::time_point sessionStart_;
    ParticipantRegistry registry_;
    std::unique_ptr<RecognitionEventProcessor> processor_;
    std::shared_ptr<BufferFlushScheduler> scheduler_;

    // Side channels
    audio::QualityMonitor qualityMonitor_;
    speaker::SpeakerProfileMatcher speakerMatcher_;

    IngestionDiagnostics diagnostics_;
};

template<typename T, typename F>
T SessionCoordinator::runOnLoop(F&& fn, T fallback, const char* operation) {
    auto scoped = [this, &fn, operation]() {
        utils::ErrorContext scope(std::string("SessionCoordinator::") + operation, context_.sessionId);
        return fn();
    };
    try {
        if (executor_->isWorkerThread()) {
            return scoped();
        }
        auto result = taskQueue_->enqueueWithFuture(TaskPriority::NORMAL, scoped);
        return result.get();
    } catch (const std::future_error& e) {
        utils::Logger::warn(std::string("Session loop rejected ") + operation + ": " + e.what());
    } catch (const std::exception& e) {
        utils::Logger::error(std::string(operation) + " failed: " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, operation, getSessionId());
    }
    return fallback;
}

} // namespace core
} // namespace collabscribe
