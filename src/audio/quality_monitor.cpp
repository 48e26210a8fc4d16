#include "collabscribe/audio/quality_monitor.hpp"
#include "collabscribe/utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace collabscribe {
namespace audio {

std::string qualityTierToString(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return "excellent";
        case QualityTier::GOOD: return "good";
        case QualityTier::FAIR: return "fair";
        case QualityTier::POOR: return "poor";
    }
    return "poor";
}

ThresholdQualityClassifier::ThresholdQualityClassifier(float excellentDb, float goodDb, float fairDb)
    : excellentDb_(excellentDb), goodDb_(goodDb), fairDb_(fairDb) {
}

QualityTier ThresholdQualityClassifier::classify(float averageLevelDb) const {
    if (averageLevelDb > excellentDb_) {
        return QualityTier::EXCELLENT;
    }
    if (averageLevelDb > goodDb_) {
        return QualityTier::GOOD;
    }
    if (averageLevelDb > fairDb_) {
        return QualityTier::FAIR;
    }
    return QualityTier::POOR;
}

QualityMonitor::QualityMonitor(size_t capacity, std::shared_ptr<QualityClassifier> classifier)
    : capacity_(std::max<size_t>(1, capacity))
    , classifier_(classifier ? std::move(classifier) : std::make_shared<ThresholdQualityClassifier>())
    , sum_(0.0)
    , tier_(QualityTier::GOOD)
    , dropped_(0)
    , clamped_(0) {
}

void QualityMonitor::record(float levelDb) {
    if (std::isnan(levelDb)) {
        dropped_++;
        utils::Logger::debug("QualityMonitor dropped NaN level sample");
        return;
    }
    if (std::isinf(levelDb)) {
        levelDb = levelDb < 0.0f ? kMinimumLevelDb : 0.0f;
        clamped_++;
    } else if (levelDb < kMinimumLevelDb) {
        levelDb = kMinimumLevelDb;
        clamped_++;
    }

    QualityTier oldTier;
    QualityTier newTier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        window_.push_back(levelDb);
        sum_ += levelDb;
        if (window_.size() > capacity_) {
            sum_ -= window_.front();
            window_.pop_front();
        }

        oldTier = tier_;
        tier_ = classifier_->classify(static_cast<float>(sum_ / static_cast<double>(window_.size())));
        newTier = tier_;
    }

    if (oldTier != newTier) {
        TierChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = tierChangeCallback_;
        }
        if (callback) {
            callback(oldTier, newTier);
        }
    }
}

QualityTier QualityMonitor::currentTier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_;
}

float QualityMonitor::averageLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (window_.empty()) {
        return 0.0f;
    }
    return static_cast<float>(sum_ / static_cast<double>(window_.size()));
}

size_t QualityMonitor::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

void QualityMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
    sum_ = 0.0;
    tier_ = QualityTier::GOOD;
}

void QualityMonitor::setTierChangeCallback(TierChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tierChangeCallback_ = std::move(callback);
}

void QualityMonitor::setClassifier(std::shared_ptr<QualityClassifier> classifier) {
    if (!classifier) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    classifier_ = std::move(classifier);
    if (!window_.empty()) {
        tier_ = classifier_->classify(static_cast<float>(sum_ / static_cast<double>(window_.size())));
    }
}

} // namespace audio
} // namespace collabscribe
