#include "collabscribe/core/participant_registry.hpp"

namespace collabscribe {
namespace core {

bool ParticipantRegistry::add(const std::string& participantId, const std::string& displayName) {
    if (participantId.empty() || participants_.count(participantId) > 0) {
        return false;
    }

    ParticipantState state;
    state.participantId = participantId;
    state.displayName = displayName;
    participants_.emplace(participantId, std::move(state));
    return true;
}

bool ParticipantRegistry::remove(const std::string& participantId) {
    return participants_.erase(participantId) > 0;
}

ParticipantState* ParticipantRegistry::find(const std::string& participantId) {
    auto it = participants_.find(participantId);
    return it != participants_.end() ? &it->second : nullptr;
}

const ParticipantState* ParticipantRegistry::find(const std::string& participantId) const {
    auto it = participants_.find(participantId);
    return it != participants_.end() ? &it->second : nullptr;
}

bool ParticipantRegistry::contains(const std::string& participantId) const {
    return participants_.count(participantId) > 0;
}

std::string ParticipantRegistry::displayName(const std::string& participantId) const {
    const ParticipantState* state = find(participantId);
    if (state == nullptr || state->displayName.empty()) {
        return participantId;
    }
    return state->displayName;
}

std::vector<std::string> ParticipantRegistry::participantIds() const {
    std::vector<std::string> ids;
    ids.reserve(participants_.size());
    for (const auto& entry : participants_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<ParticipantState> ParticipantRegistry::snapshot() const {
    std::vector<ParticipantState> states;
    states.reserve(participants_.size());
    for (const auto& entry : participants_) {
        states.push_back(entry.second);
    }
    return states;
}

} // namespace core
} // namespace collabscribe
