#pragma once

#include <vector>

namespace collabscribe {
namespace audio {

/**
 * Coarse acoustic description of one PCM frame
 */
struct FrameFeatures {
    float pitch;              // scaled RMS, not a real F0 estimate
    float energy;             // mean squared amplitude
    float spectralCentroid;   // magnitude-weighted sample index
    float levelDb;            // 20*log10(mean |x|)

    FrameFeatures() : pitch(0.0f), energy(0.0f), spectralCentroid(0.0f), levelDb(-160.0f) {}

    /**
     * {pitch, energy, spectralCentroid}, the vector fed to the speaker matcher
     */
    std::vector<float> toVector() const { return {pitch, energy, spectralCentroid}; }
};

/**
 * Strategy interface turning a mono PCM frame into features
 */
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    virtual FrameFeatures extract(const std::vector<float>& samples) const = 0;
};

/**
 * Time-domain heuristic extractor. An empty frame yields zero features and the
 * minimum level.
 */
class SimpleFeatureExtractor : public FeatureExtractor {
public:
    static constexpr float kPitchScale = 1000.0f;
    static constexpr float kMinimumLevelDb = -160.0f;

    FrameFeatures extract(const std::vector<float>& samples) const override;

    static float calculateRMSLevel(const std::vector<float>& samples);
    static float calculateEnergy(const std::vector<float>& samples);
    static float calculateSpectralCentroid(const std::vector<float>& samples);
    static float calculateLevelDb(const std::vector<float>& samples);
};

} // namespace audio
} // namespace collabscribe
