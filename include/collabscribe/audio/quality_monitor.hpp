#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace collabscribe {
namespace audio {

enum class QualityTier {
    EXCELLENT,
    GOOD,
    FAIR,
    POOR
};

std::string qualityTierToString(QualityTier tier);

/**
 * Strategy that maps an average window level (dB) to a quality tier
 */
class QualityClassifier {
public:
    virtual ~QualityClassifier() = default;
    virtual QualityTier classify(float averageLevelDb) const = 0;
};

/**
 * Fixed-threshold classifier without hysteresis:
 * avg > excellent -> EXCELLENT, > good -> GOOD, > fair -> FAIR, else POOR
 */
class ThresholdQualityClassifier : public QualityClassifier {
public:
    ThresholdQualityClassifier(float excellentDb = -20.0f, float goodDb = -30.0f, float fairDb = -40.0f);

    QualityTier classify(float averageLevelDb) const override;

private:
    float excellentDb_;
    float goodDb_;
    float fairDb_;
};

/**
 * Rolling audio-level window that classifies the current transcription quality.
 * Thread-safe; owned state is only mutated through record()/reset().
 */
class QualityMonitor {
public:
    using TierChangeCallback = std::function<void(QualityTier oldTier, QualityTier newTier)>;

    static constexpr float kMinimumLevelDb = -160.0f;

    explicit QualityMonitor(size_t capacity = 100,
                            std::shared_ptr<QualityClassifier> classifier = nullptr);

    /**
     * Add one level reading. NaN is dropped, -inf is clamped to kMinimumLevelDb,
     * +inf to 0 dB; both cases are counted as rejected/clamped samples.
     */
    void record(float levelDb);

    QualityTier currentTier() const;
    float averageLevel() const;
    size_t sampleCount() const;
    size_t capacity() const { return capacity_; }

    size_t droppedSamples() const { return dropped_; }
    size_t clampedSamples() const { return clamped_; }

    void reset();

    void setTierChangeCallback(TierChangeCallback callback);
    void setClassifier(std::shared_ptr<QualityClassifier> classifier);

private:
    const size_t capacity_;
    std::shared_ptr<QualityClassifier> classifier_;

    mutable std::mutex mutex_;
    std::deque<float> window_;
    double sum_;
    QualityTier tier_;

    std::mutex callbackMutex_;
    TierChangeCallback tierChangeCallback_;

    std::atomic<size_t> dropped_;
    std::atomic<size_t> clamped_;
};

} // namespace audio
} // namespace collabscribe
