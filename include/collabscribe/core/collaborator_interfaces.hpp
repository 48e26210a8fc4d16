#pragma once

#include "collabscribe/core/transcription_segment.hpp"
#include <string>

namespace collabscribe {
namespace core {

/**
 * Speech recognition capability check (permission, model availability)
 */
class RecognitionAuthorizer {
public:
    virtual ~RecognitionAuthorizer() = default;
    virtual bool isAuthorized() const = 0;
};

/**
 * Audio capture pipeline. The core only starts and stops it; frames are pushed
 * back through SessionCoordinator::ingestAudioFrame/ingestAudioSample.
 */
class AudioIntake {
public:
    virtual ~AudioIntake() = default;

    /**
     * @return false if the pipeline could not be brought up, see lastError()
     */
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual std::string lastError() const = 0;
};

/**
 * Outbound replication of segments to remote peers. Receives every interim
 * flush and every finalized segment.
 */
class TranscriptBroadcaster {
public:
    virtual ~TranscriptBroadcaster() = default;
    virtual void broadcastSegment(const TranscriptionSegment& segment) = 0;
};

} // namespace core
} // namespace collabscribe
