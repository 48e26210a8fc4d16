#include "collabscribe/audio/feature_extractor.hpp"
#include <cmath>

namespace collabscribe {
namespace audio {

FrameFeatures SimpleFeatureExtractor::extract(const std::vector<float>& samples) const {
    FrameFeatures features;
    if (samples.empty()) {
        return features;
    }

    features.pitch = calculateRMSLevel(samples) * kPitchScale;
    features.energy = calculateEnergy(samples);
    features.spectralCentroid = calculateSpectralCentroid(samples);
    features.levelDb = calculateLevelDb(samples);
    return features;
}

float SimpleFeatureExtractor::calculateRMSLevel(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    return std::sqrt(calculateEnergy(samples));
}

float SimpleFeatureExtractor::calculateEnergy(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    float sum = 0.0f;
    for (float sample : samples) {
        sum += sample * sample;
    }

    return sum / static_cast<float>(samples.size());
}

float SimpleFeatureExtractor::calculateSpectralCentroid(const std::vector<float>& samples) {
    float weightedSum = 0.0f;
    float magnitudeSum = 0.0f;

    for (size_t i = 0; i < samples.size(); ++i) {
        float magnitude = std::abs(samples[i]);
        weightedSum += static_cast<float>(i) * magnitude;
        magnitudeSum += magnitude;
    }

    return magnitudeSum > 0.0f ? weightedSum / magnitudeSum : 0.0f;
}

float SimpleFeatureExtractor::calculateLevelDb(const std::vector<float>& samples) {
    if (samples.empty()) return kMinimumLevelDb;

    float sum = 0.0f;
    for (float sample : samples) {
        sum += std::abs(sample);
    }
    float mean = sum / static_cast<float>(samples.size());

    if (mean <= 0.0f) return kMinimumLevelDb;

    float level = 20.0f * std::log10(mean);
    return level < kMinimumLevelDb ? kMinimumLevelDb : level;
}

} // namespace audio
} // namespace collabscribe
