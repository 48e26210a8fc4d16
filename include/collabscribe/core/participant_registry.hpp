#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

/**
 * Ephemeral per-participant ingestion state of one session
 */
struct ParticipantState {
    std::string participantId;
    std::string displayName;
    bool micEnabled;

    // Latest partial hypothesis, cleared on finalization
    std::string interimBuffer;

    // Session-relative time of the first partial of the current utterance
    std::optional<double> utteranceStartTime;

    // Id shared by the interim segments of the current utterance, empty until
    // the first flush
    std::string activeSegmentId;

    ParticipantState() : micEnabled(true) {}

    /**
     * Reset the utterance: buffer, start time and segment id
     */
    void clearUtterance() {
        interimBuffer.clear();
        utteranceStartTime.reset();
        activeSegmentId.clear();
    }
};

/**
 * Roster of the active session keyed by participant id. Not synchronized:
 * owned and mutated exclusively by the session loop.
 */
class ParticipantRegistry {
public:
    /**
     * Add a participant with micEnabled=true. Returns false if already present.
     */
    bool add(const std::string& participantId, const std::string& displayName);
    bool remove(const std::string& participantId);

    ParticipantState* find(const std::string& participantId);
    const ParticipantState* find(const std::string& participantId) const;
    bool contains(const std::string& participantId) const;

    /**
     * Display name, or the id itself when the participant has no name
     */
    std::string displayName(const std::string& participantId) const;

    std::vector<std::string> participantIds() const;
    std::vector<ParticipantState> snapshot() const;

    size_t size() const { return participants_.size(); }
    bool empty() const { return participants_.empty(); }
    void clear() { participants_.clear(); }

private:
    std::map<std::string, ParticipantState> participants_;
};

} // namespace core
} // namespace collabscribe
