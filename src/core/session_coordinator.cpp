#include "collabscribe/core/session_coordinator.hpp"
#include "collabscribe/utils/time_format.hpp"
#include <cmath>

namespace collabscribe {
namespace core {

namespace {

utils::TranscriptionConfig validatedConfig(const utils::TranscriptionConfig& config) {
    utils::ConfigValidationResult validation = utils::TranscriptionConfigManager::validate(config);
    for (const auto& warning : validation.warnings) {
        utils::Logger::warn("Transcription config: " + warning);
    }
    if (validation.isValid) {
        return config;
    }

    for (const auto& error : validation.errors) {
        utils::Logger::error("Transcription config: " + error);
    }
    COLLABSCRIBE_REPORT_ERROR(utils::ErrorCategory::CONFIG, utils::ErrorSeverity::ERROR,
                              "Invalid transcription configuration, using defaults",
                              validation.errors.front());
    return utils::TranscriptionConfig{};
}

} // namespace

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::ACTIVE: return "active";
        case SessionState::STOPPED: return "stopped";
    }
    return "unknown";
}

std::string transcriptionErrorToString(TranscriptionError error) {
    switch (error) {
        case TranscriptionError::NONE: return "No error";
        case TranscriptionError::NOT_AUTHORIZED: return "Speech recognition not authorized";
        case TranscriptionError::NO_ACTIVE_SESSION: return "No active collaboration session";
        case TranscriptionError::AUDIO_PIPELINE_FAILURE: return "Audio pipeline failure";
        case TranscriptionError::SESSION_ALREADY_ACTIVE: return "Transcription session already active";
        case TranscriptionError::UNKNOWN_PARTICIPANT: return "Unknown participant";
    }
    return "Unknown error";
}

SessionCoordinator::SessionCoordinator(const utils::TranscriptionConfig& config,
                                       std::shared_ptr<RecognitionAuthorizer> authorizer,
                                       std::shared_ptr<AudioIntake> audioIntake,
                                       std::shared_ptr<TranscriptBroadcaster> broadcaster,
                                       std::shared_ptr<SessionClock> clock)
    : config_(validatedConfig(config))
    , clock_(clock ? std::move(clock) : makeSystemClock())
    , authorizer_(std::move(authorizer))
    , audioIntake_(std::move(audioIntake))
    , broadcaster_(std::move(broadcaster))
    , featureExtractor_(std::make_shared<audio::SimpleFeatureExtractor>())
    , taskQueue_(std::make_shared<TaskQueue>())
    , executor_(std::make_unique<SerialExecutor>())
    , state_(SessionState::IDLE)
    , ledger_(std::make_shared<SegmentLedger>())
    , qualityMonitor_(config_.qualityWindowSize,
                      std::make_shared<audio::ThresholdQualityClassifier>(config_.excellentThresholdDb,
                                                                          config_.goodThresholdDb,
                                                                          config_.fairThresholdDb))
    , speakerMatcher_(config_.speakerMatchThreshold) {

    qualityMonitor_.setTierChangeCallback([this](audio::QualityTier oldTier, audio::QualityTier newTier) {
        TranscriptionEvent event = makeEvent(TranscriptionEventType::QUALITY_CHANGED, "");
        event.previousQuality = audio::qualityTierToString(oldTier);
        event.quality = audio::qualityTierToString(newTier);
        emitEvent(event);
    });

    executor_->start(taskQueue_);
}

SessionCoordinator::~SessionCoordinator() {
    if (state_ == SessionState::ACTIVE) {
        stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    executor_->stop();
    qualityMonitor_.setTierChangeCallback(nullptr);
}

void SessionCoordinator::setRecognitionAuthorizer(std::shared_ptr<RecognitionAuthorizer> authorizer) {
    std::lock_guard<std::mutex> lock(collaboratorMutex_);
    authorizer_ = std::move(authorizer);
}

void SessionCoordinator::setAudioIntake(std::shared_ptr<AudioIntake> audioIntake) {
    std::lock_guard<std::mutex> lock(collaboratorMutex_);
    audioIntake_ = std::move(audioIntake);
}

void SessionCoordinator::setBroadcaster(std::shared_ptr<TranscriptBroadcaster> broadcaster) {
    std::lock_guard<std::mutex> lock(collaboratorMutex_);
    broadcaster_ = std::move(broadcaster);
}

void SessionCoordinator::setFeatureExtractor(std::shared_ptr<audio::FeatureExtractor> extractor) {
    if (!extractor) {
        return;
    }
    std::lock_guard<std::mutex> lock(collaboratorMutex_);
    featureExtractor_ = std::move(extractor);
}

void SessionCoordinator::setEventCallback(TranscriptionEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    eventCallback_ = std::move(callback);
}

// Lifecycle

OperationResult SessionCoordinator::start(const std::optional<SessionContext>& context) {
    return runOnLoop([this, context]() { return doStart(context); },
                     OperationResult(TranscriptionError::AUDIO_PIPELINE_FAILURE, "Session loop unavailable"),
                     "start");
}

void SessionCoordinator::stop() {
    runOnLoop([this]() {
        doStop();
        return true;
    }, false, "stop");
}

OperationResult SessionCoordinator::pause(const std::string& participantId) {
    return runOnLoop([this, participantId]() { return doSetMicEnabled(participantId, false); },
                     OperationResult(TranscriptionError::NO_ACTIVE_SESSION, "Session loop unavailable"),
                     "pause");
}

OperationResult SessionCoordinator::resume(const std::string& participantId) {
    return runOnLoop([this, participantId]() { return doSetMicEnabled(participantId, true); },
                     OperationResult(TranscriptionError::NO_ACTIVE_SESSION, "Session loop unavailable"),
                     "resume");
}

OperationResult SessionCoordinator::doStart(const std::optional<SessionContext>& context) {
    utils::ErrorContext scope("SessionCoordinator::start", context ? context->sessionId : std::string());

    if (state_ == SessionState::ACTIVE) {
        return failure(TranscriptionError::SESSION_ALREADY_ACTIVE,
                       "Session " + getSessionId() + " is already active");
    }

    std::shared_ptr<RecognitionAuthorizer> authorizer;
    std::shared_ptr<AudioIntake> audioIntake;
    {
        std::lock_guard<std::mutex> lock(collaboratorMutex_);
        authorizer = authorizer_;
        audioIntake = audioIntake_;
    }

    if (!authorizer || !authorizer->isAuthorized()) {
        return failure(TranscriptionError::NOT_AUTHORIZED,
                       transcriptionErrorToString(TranscriptionError::NOT_AUTHORIZED),
                       utils::ErrorCategory::RECOGNITION);
    }

    if (!context || context->sessionId.empty()) {
        return failure(TranscriptionError::NO_ACTIVE_SESSION,
                       transcriptionErrorToString(TranscriptionError::NO_ACTIVE_SESSION));
    }

    if (audioIntake && !audioIntake->start()) {
        std::string reason = audioIntake->lastError();
        return failure(TranscriptionError::AUDIO_PIPELINE_FAILURE,
                       reason.empty() ? transcriptionErrorToString(TranscriptionError::AUDIO_PIPELINE_FAILURE)
                                      : "Audio pipeline failure: " + reason,
                       utils::ErrorCategory::AUDIO_INTAKE);
    }

    auto ledger = std::make_shared<SegmentLedger>();
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        sessionId_ = context->sessionId;
        ledger_ = ledger;
        summary_.reset();
    }

    context_ = *context;
    sessionStart_ = clock_->now();
    diagnostics_.reset();
    qualityMonitor_.reset();
    speakerMatcher_.clear();

    registry_.clear();
    for (const auto& participant : context_.participants) {
        if (!registry_.add(participant.participantId, participant.displayName)) {
            utils::Logger::warn("Ignoring duplicate or empty participant id '" + participant.participantId + "'");
        }
    }

    processor_ = std::make_unique<RecognitionEventProcessor>(registry_, *ledger, clock_, sessionStart_,
                                                             context_.sessionId, diagnostics_,
                                                             config_.defaultLanguage);
    processor_->setSegmentPublisher([this](TranscriptionEventType type, const TranscriptionSegment& segment, bool broadcast) {
        onSegmentPublished(type, segment, broadcast);
    });

    if (scheduler_) {
        scheduler_->stop();
    }
    scheduler_ = std::make_shared<BufferFlushScheduler>(taskQueue_,
                                                        std::chrono::milliseconds(config_.flushIntervalMs),
                                                        [this]() { doFlush(); });
    scheduler_->start(config_.enableFlushTimer);

    state_ = SessionState::ACTIVE;
    utils::Logger::info("Transcription session " + context_.sessionId + " started with " +
                        std::to_string(registry_.size()) + " participant(s)");
    return OperationResult::ok();
}

void SessionCoordinator::doStop() {
    if (state_ != SessionState::ACTIVE) {
        utils::Logger::debug("stop() ignored, session is " + sessionStateToString(state_));
        return;
    }

    if (scheduler_) {
        scheduler_->stop();
    }

    std::shared_ptr<SegmentLedger> ledger = ledger_;

    // Buffered or interim content of every participant, including remote
    // participants that only have an active segment in the ledger
    std::vector<std::string> pending = registry_.participantIds();
    for (const auto& participantId : ledger->activeParticipants()) {
        if (!registry_.contains(participantId)) {
            pending.push_back(participantId);
        }
    }

    size_t drained = 0;
    for (const auto& participantId : pending) {
        if (processor_->finalizePending(participantId, config_.interimConfidence)) {
            drained++;
        }
    }

    if (ledger->activeCount() > 0) {
        diagnostics_.stopInconsistencies++;
        utils::Logger::warn("Active segments left after draining session " + context_.sessionId);
        COLLABSCRIBE_REPORT_ERROR(utils::ErrorCategory::LEDGER, utils::ErrorSeverity::WARNING,
                                  "Active segments left after stop", context_.sessionId);
    }

    std::shared_ptr<AudioIntake> audioIntake;
    {
        std::lock_guard<std::mutex> lock(collaboratorMutex_);
        audioIntake = audioIntake_;
    }
    if (audioIntake) {
        audioIntake->stop();
    }

    ledger->freeze();
    state_ = SessionState::STOPPED;

    SessionSummary summary = SessionSummarizer::summarize(*ledger, context_.sessionId, sessionStart_,
                                                          clock_->now(), registry_.participantIds(),
                                                          utils::truncateToMillis(clock_->wallNow()));
    for (auto& entry : summary.participantStats) {
        if (entry.second.participantName.empty()) {
            entry.second.participantName = registry_.displayName(entry.first);
        }
    }
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        summary_ = summary;
    }

    utils::Logger::info("Transcription session " + context_.sessionId + " stopped, " +
                        std::to_string(drained) + " pending utterance(s) finalized, " +
                        std::to_string(ledger->finalCount()) + " final segment(s)");

    TranscriptionEvent event = makeEvent(TranscriptionEventType::SESSION_SUMMARY_GENERATED, "");
    event.summaryJson = summaryToJson(summary);
    emitEvent(event);
}

OperationResult SessionCoordinator::doSetMicEnabled(const std::string& participantId, bool enabled) {
    if (state_ != SessionState::ACTIVE) {
        return failure(TranscriptionError::NO_ACTIVE_SESSION,
                       transcriptionErrorToString(TranscriptionError::NO_ACTIVE_SESSION));
    }

    ParticipantState* participant = registry_.find(participantId);
    if (participant == nullptr) {
        return failure(TranscriptionError::UNKNOWN_PARTICIPANT,
                       "Unknown participant '" + participantId + "'");
    }

    if (participant->micEnabled == enabled) {
        return OperationResult::ok();
    }

    participant->micEnabled = enabled;
    if (enabled) {
        participant->clearUtterance();
    }

    utils::Logger::info(std::string("Transcription ") + (enabled ? "resumed" : "paused") +
                        " for participant '" + participantId + "'");
    emitEvent(makeEvent(enabled ? TranscriptionEventType::TRANSCRIPTION_RESUMED
                                : TranscriptionEventType::TRANSCRIPTION_PAUSED,
                        participantId));
    return OperationResult::ok();
}

// Roster

void SessionCoordinator::participantJoined(const std::string& participantId, const std::string& displayName) {
    post([this, participantId, displayName]() { doParticipantJoined(participantId, displayName); });
}

void SessionCoordinator::participantLeft(const std::string& participantId) {
    post([this, participantId]() { doParticipantLeft(participantId); });
}

void SessionCoordinator::doParticipantJoined(const std::string& participantId, const std::string& displayName) {
    if (state_ != SessionState::ACTIVE) {
        utils::Logger::debug("Ignoring join of '" + participantId + "' outside an active session");
        return;
    }

    if (!registry_.add(participantId, displayName)) {
        utils::Logger::debug("Participant '" + participantId + "' already registered");
        return;
    }
    utils::Logger::info("Participant '" + participantId + "' joined transcription session");
}

void SessionCoordinator::doParticipantLeft(const std::string& participantId) {
    if (state_ != SessionState::ACTIVE) {
        utils::Logger::debug("Ignoring departure of '" + participantId + "' outside an active session");
        return;
    }

    if (!registry_.contains(participantId)) {
        utils::Logger::debug("Departing participant '" + participantId + "' is not registered");
        return;
    }

    processor_->finalizePending(participantId, config_.interimConfidence);
    registry_.remove(participantId);
    speakerMatcher_.removeProfile(participantId);
    utils::Logger::info("Participant '" + participantId + "' left transcription session");
}

// Recognition events

void SessionCoordinator::onPartial(const std::string& participantId, const std::string& text, float confidence) {
    onRecognitionEvent(participantId, text, confidence, false);
}

void SessionCoordinator::onFinal(const std::string& participantId, const std::string& text, float confidence) {
    onRecognitionEvent(participantId, text, confidence, true);
}

void SessionCoordinator::onRecognitionEvent(const std::string& participantId, const std::string& text,
                                            float confidence, bool isFinal) {
    post([this, participantId, text, confidence, isFinal]() {
        if (state_ != SessionState::ACTIVE || !processor_) {
            diagnostics_.inactiveSessionEvents++;
            return;
        }
        if (isFinal) {
            processor_->onFinal(participantId, text, confidence);
        } else {
            processor_->onPartial(participantId, text, confidence);
        }
    });
}

void SessionCoordinator::applyRemoteSegment(const TranscriptionSegment& segment) {
    post([this, segment]() { doApplyRemoteSegment(segment); });
}

void SessionCoordinator::doApplyRemoteSegment(TranscriptionSegment segment) {
    if (state_ != SessionState::ACTIVE) {
        diagnostics_.rejectedRemoteSegments++;
        utils::Logger::debug("Ignoring remote segment outside an active session");
        return;
    }

    if (segment.id.empty() || segment.participantId.empty()) {
        diagnostics_.rejectedRemoteSegments++;
        utils::Logger::warn("Rejecting remote segment without id or participant");
        return;
    }
    if (!segment.sessionId.empty() && segment.sessionId != context_.sessionId) {
        diagnostics_.rejectedRemoteSegments++;
        utils::Logger::warn("Rejecting remote segment " + segment.id + " of session " + segment.sessionId);
        return;
    }
    if (!std::isfinite(segment.startTime) || !std::isfinite(segment.endTime)) {
        diagnostics_.rejectedRemoteSegments++;
        utils::Logger::warn("Rejecting remote segment " + segment.id + " with non-finite times");
        return;
    }

    segment.sessionId = context_.sessionId;
    segment.createdAt = utils::truncateToMillis(segment.createdAt);
    if (segment.startTime < 0.0) {
        segment.startTime = 0.0;
        diagnostics_.clampedValues++;
    }
    if (segment.endTime < segment.startTime) {
        segment.endTime = segment.startTime;
        diagnostics_.clampedValues++;
    }
    if (std::isnan(segment.confidence) || segment.confidence < 0.0f) {
        segment.confidence = 0.0f;
        diagnostics_.clampedValues++;
    } else if (segment.confidence > 1.0f) {
        segment.confidence = 1.0f;
        diagnostics_.clampedValues++;
    }

    if (!ledger_->append(segment)) {
        diagnostics_.rejectedRemoteSegments++;
        return;
    }

    onSegmentPublished(segment.isFinal ? TranscriptionEventType::SEGMENT_FINALIZED
                                       : TranscriptionEventType::SEGMENT_UPDATED,
                       segment, false);
}

size_t SessionCoordinator::flushInterimBuffers() {
    return runOnLoop([this]() { return doFlush(); }, size_t(0), "flushInterimBuffers");
}

size_t SessionCoordinator::doFlush() {
    if (state_ != SessionState::ACTIVE || !processor_) {
        return 0;
    }
    return processor_->flushInterim(config_.interimConfidence);
}

void SessionCoordinator::waitForIdle() {
    runOnLoop([]() { return true; }, false, "waitForIdle");
}

// Audio side channels

void SessionCoordinator::ingestAudioSample(const std::string& participantId, float levelDb,
                                           const std::vector<float>& features) {
    if (state_ != SessionState::ACTIVE) {
        diagnostics_.rejectedAudioSamples++;
        return;
    }

    if (std::isnan(levelDb)) {
        diagnostics_.rejectedAudioSamples++;
    } else if (std::isinf(levelDb) || levelDb < audio::QualityMonitor::kMinimumLevelDb) {
        diagnostics_.clampedValues++;
    }
    qualityMonitor_.record(levelDb);

    if (!features.empty() && !speakerMatcher_.observe(participantId, features)) {
        diagnostics_.rejectedAudioSamples++;
    }
}

void SessionCoordinator::ingestAudioFrame(const std::string& participantId, const std::vector<float>& samples) {
    if (samples.empty()) {
        diagnostics_.rejectedAudioSamples++;
        return;
    }

    std::shared_ptr<audio::FeatureExtractor> extractor;
    {
        std::lock_guard<std::mutex> lock(collaboratorMutex_);
        extractor = featureExtractor_;
    }

    audio::FrameFeatures features = extractor->extract(samples);
    ingestAudioSample(participantId, features.levelDb, features.toVector());
}

speaker::SpeakerMatch SessionCoordinator::identifySpeaker(const std::vector<float>& features) {
    speaker::SpeakerMatch match = speakerMatcher_.match(features);
    if (match.isKnown()) {
        TranscriptionEvent event = makeEvent(TranscriptionEventType::SPEAKER_IDENTIFIED, match.speakerId);
        event.speakerId = match.speakerId;
        event.speakerConfidence = match.confidence;
        emitEvent(event);
    }
    return match;
}

// Queries

std::string SessionCoordinator::getSessionId() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return sessionId_;
}

std::shared_ptr<const SegmentLedger> SessionCoordinator::getLedger() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return ledger_;
}

std::vector<TranscriptionSegment> SessionCoordinator::getTranscriptionForParticipant(const std::string& participantId) const {
    SegmentFilter filter;
    filter.participantIds.insert(participantId);
    return query(filter);
}

std::vector<TranscriptionSegment> SessionCoordinator::getTranscriptionInTimeRange(double startTime, double endTime) const {
    SegmentFilter filter;
    filter.startAfter = startTime;
    filter.endBefore = endTime;
    return query(filter);
}

std::vector<TranscriptionSegment> SessionCoordinator::searchTranscription(const std::string& text) const {
    SegmentFilter filter;
    filter.text = text;
    return query(filter);
}

std::vector<TranscriptionSegment> SessionCoordinator::query(const SegmentFilter& filter) const {
    return getLedger()->query(filter);
}

std::string SessionCoordinator::exportTranscript(ExportFormat format) const {
    try {
        return TranscriptExporter::exportTranscript(*getLedger(), format);
    } catch (const std::exception& e) {
        utils::Logger::error("Exporting transcript as " + exportFormatToString(format) + " failed: " + e.what());
        utils::ErrorHandler::getInstance().reportError(e, "SessionCoordinator::exportTranscript", getSessionId());
    }
    return std::string();
}

std::optional<SessionSummary> SessionCoordinator::getSessionSummary() const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return summary_;
}

std::string SessionCoordinator::getInterimBuffer(const std::string& participantId) {
    return runOnLoop([this, participantId]() {
        const ParticipantState* participant = registry_.find(participantId);
        return participant ? participant->interimBuffer : std::string();
    }, std::string(), "getInterimBuffer");
}

bool SessionCoordinator::isMicEnabled(const std::string& participantId) {
    return runOnLoop([this, participantId]() {
        const ParticipantState* participant = registry_.find(participantId);
        return participant != nullptr && participant->micEnabled;
    }, false, "isMicEnabled");
}

std::vector<ParticipantState> SessionCoordinator::getParticipants() {
    return runOnLoop([this]() { return registry_.snapshot(); },
                     std::vector<ParticipantState>(), "getParticipants");
}

// Event fan-out

void SessionCoordinator::onSegmentPublished(TranscriptionEventType type, const TranscriptionSegment& segment,
                                            bool broadcast) {
    if (broadcast) {
        std::shared_ptr<TranscriptBroadcaster> broadcaster;
        {
            std::lock_guard<std::mutex> lock(collaboratorMutex_);
            broadcaster = broadcaster_;
        }
        if (broadcaster) {
            try {
                broadcaster->broadcastSegment(segment);
            } catch (const std::exception& e) {
                utils::Logger::error("Broadcasting segment " + segment.id + " failed: " + e.what());
                utils::ErrorHandler::getInstance().reportError(e, "TranscriptBroadcaster", segment.sessionId);
            }
        }
    }

    TranscriptionEvent event = makeEvent(type, segment.participantId);
    event.segment = segment;
    emitEvent(event);
}

void SessionCoordinator::emitEvent(const TranscriptionEvent& event) {
    TranscriptionEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = eventCallback_;
    }
    if (callback) {
        callback(event);
    }
}

TranscriptionEvent SessionCoordinator::makeEvent(TranscriptionEventType type, const std::string& participantId) const {
    TranscriptionEvent event(type);
    event.sessionId = getSessionId();
    event.participantId = participantId;
    return event;
}

OperationResult SessionCoordinator::failure(TranscriptionError error, const std::string& message,
                                            utils::ErrorCategory category) {
    utils::Logger::warn("Transcription operation failed: " + message);
    COLLABSCRIBE_REPORT_ERROR(category, utils::ErrorSeverity::WARNING, message,
                              transcriptionErrorToString(error));
    return OperationResult(error, message);
}

void SessionCoordinator::post(std::function<void()> task) {
    auto scoped = [this, task = std::move(task)]() {
        utils::ErrorContext scope("SessionCoordinator", context_.sessionId);
        task();
    };
    if (!taskQueue_->enqueue(std::move(scoped), TaskPriority::NORMAL)) {
        utils::Logger::warn("Session loop is shut down, dropping task");
    }
}

} // namespace core
} // namespace collabscribe
