#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace collabscribe {
namespace speaker {

struct SpeakerProfile {
    std::string speakerId;
    float confidence;               // confidence of the last successful match
    std::vector<float> featureVector;
    size_t observationCount;

    SpeakerProfile() : confidence(0.0f), observationCount(0) {}
};

struct SpeakerMatch {
    std::string speakerId;
    float confidence;

    SpeakerMatch() : speakerId(kUnknownSpeaker), confidence(0.0f) {}
    SpeakerMatch(std::string id, float conf) : speakerId(std::move(id)), confidence(conf) {}

    bool isKnown() const { return speakerId != kUnknownSpeaker; }

    static constexpr const char* kUnknownSpeaker = "unknown";
};

/**
 * Coarse heuristic speaker annotation over per-participant moving-average
 * feature profiles. It annotates segments, it never decides attribution.
 * Thread-safe.
 */
class SpeakerProfileMatcher {
public:
    explicit SpeakerProfileMatcher(float matchThreshold = 0.7f);

    /**
     * Fold a feature vector into the participant's profile:
     * new = (old + incoming) / 2. Seeds the profile when none exists or the
     * vector length changed. Returns false (and counts a rejection) for empty
     * or non-finite input.
     */
    bool observe(const std::string& participantId, const std::vector<float>& features);

    /**
     * Best profile whose similarity reaches the threshold, else "unknown"
     */
    SpeakerMatch match(const std::vector<float>& features);

    std::optional<SpeakerProfile> profile(const std::string& participantId) const;
    std::vector<SpeakerProfile> profiles() const;
    bool removeProfile(const std::string& participantId);
    void clear();

    float getMatchThreshold() const { return matchThreshold_; }
    size_t rejectedObservations() const { return rejected_; }

    /**
     * Normalized inverse distance 1 - |a-b| / (|a| + |b|), in [0, 1].
     * Vectors of different length have similarity 0.
     */
    static float similarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    static bool isUsable(const std::vector<float>& features);

    const float matchThreshold_;

    mutable std::mutex mutex_;
    std::map<std::string, SpeakerProfile> profiles_;
    std::atomic<size_t> rejected_;
};

} // namespace speaker
} // namespace collabscribe
