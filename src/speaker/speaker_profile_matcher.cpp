#include "collabscribe/speaker/speaker_profile_matcher.hpp"
#include "collabscribe/utils/logging.hpp"
#include <cmath>

namespace collabscribe {
namespace speaker {

SpeakerProfileMatcher::SpeakerProfileMatcher(float matchThreshold)
    : matchThreshold_(matchThreshold), rejected_(0) {
}

bool SpeakerProfileMatcher::isUsable(const std::vector<float>& features) {
    if (features.empty()) {
        return false;
    }
    for (float value : features) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return true;
}

bool SpeakerProfileMatcher::observe(const std::string& participantId, const std::vector<float>& features) {
    if (participantId.empty() || !isUsable(features)) {
        rejected_++;
        utils::Logger::debug("Rejected feature observation for participant '" + participantId + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(participantId);
    if (it == profiles_.end()) {
        SpeakerProfile profile;
        profile.speakerId = participantId;
        profile.featureVector = features;
        profile.observationCount = 1;
        profiles_.emplace(participantId, std::move(profile));
        return true;
    }

    SpeakerProfile& profile = it->second;
    if (profile.featureVector.size() != features.size()) {
        utils::Logger::debug("Feature length changed for participant '" + participantId + "', reseeding profile");
        profile.featureVector = features;
        profile.observationCount = 1;
        return true;
    }

    for (size_t i = 0; i < features.size(); ++i) {
        profile.featureVector[i] = (profile.featureVector[i] + features[i]) / 2.0f;
    }
    profile.observationCount++;
    return true;
}

SpeakerMatch SpeakerProfileMatcher::match(const std::vector<float>& features) {
    if (!isUsable(features)) {
        rejected_++;
        return SpeakerMatch();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    SpeakerProfile* best = nullptr;
    float bestSimilarity = -1.0f;
    for (auto& entry : profiles_) {
        float score = similarity(entry.second.featureVector, features);
        if (score > bestSimilarity) {
            bestSimilarity = score;
            best = &entry.second;
        }
    }

    if (best == nullptr || bestSimilarity < matchThreshold_) {
        return SpeakerMatch();
    }

    best->confidence = bestSimilarity;
    return SpeakerMatch(best->speakerId, bestSimilarity);
}

std::optional<SpeakerProfile> SpeakerProfileMatcher::profile(const std::string& participantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(participantId);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SpeakerProfile> SpeakerProfileMatcher::profiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SpeakerProfile> result;
    result.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        result.push_back(entry.second);
    }
    return result;
}

bool SpeakerProfileMatcher::removeProfile(const std::string& participantId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.erase(participantId) > 0;
}

void SpeakerProfileMatcher::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.clear();
}

float SpeakerProfileMatcher::similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    double diff = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        diff += d * d;
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    double denominator = std::sqrt(normA) + std::sqrt(normB);
    if (denominator <= 0.0) {
        // Both vectors are zero
        return 1.0f;
    }

    double score = 1.0 - std::sqrt(diff) / denominator;
    if (score < 0.0) score = 0.0;
    if (score > 1.0) score = 1.0;
    return static_cast<float>(score);
}

} // namespace speaker
} // namespace collabscribe
