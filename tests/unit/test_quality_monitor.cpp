#include <gtest/gtest.h>
#include "collabscribe/audio/quality_monitor.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace collabscribe::audio;

class QualityMonitorTest : public ::testing::Test {
protected:
    void feed(QualityMonitor& monitor, float level, int count) {
        for (int i = 0; i < count; ++i) {
            monitor.record(level);
        }
    }
};

TEST_F(QualityMonitorTest, ConstantLevelMapsToThresholdBucket) {
    struct Case {
        float level;
        QualityTier expected;
    };
    const std::vector<Case> cases = {
        {-10.0f, QualityTier::EXCELLENT},
        {-20.0f, QualityTier::GOOD},        // strict comparison
        {-25.0f, QualityTier::GOOD},
        {-30.0f, QualityTier::FAIR},
        {-35.0f, QualityTier::FAIR},
        {-40.0f, QualityTier::POOR},
        {-60.0f, QualityTier::POOR},
    };

    for (const auto& c : cases) {
        QualityMonitor monitor;
        feed(monitor, c.level, 150);
        EXPECT_EQ(monitor.currentTier(), c.expected) << "level " << c.level;
        EXPECT_FLOAT_EQ(monitor.averageLevel(), c.level);
    }
}

TEST_F(QualityMonitorTest, WindowEvictsOldestSamples) {
    QualityMonitor monitor(100);

    feed(monitor, -80.0f, 100);
    EXPECT_EQ(monitor.currentTier(), QualityTier::POOR);

    feed(monitor, -10.0f, 100);
    EXPECT_EQ(monitor.sampleCount(), 100u);
    EXPECT_FLOAT_EQ(monitor.averageLevel(), -10.0f);
    EXPECT_EQ(monitor.currentTier(), QualityTier::EXCELLENT);
}

TEST_F(QualityMonitorTest, NaNIsDroppedAndNegativeInfinityClamped) {
    QualityMonitor monitor;

    monitor.record(std::numeric_limits<float>::quiet_NaN());
    EXPECT_EQ(monitor.sampleCount(), 0u);
    EXPECT_EQ(monitor.droppedSamples(), 1u);

    monitor.record(-std::numeric_limits<float>::infinity());
    EXPECT_EQ(monitor.sampleCount(), 1u);
    EXPECT_EQ(monitor.clampedSamples(), 1u);
    EXPECT_FLOAT_EQ(monitor.averageLevel(), QualityMonitor::kMinimumLevelDb);
    EXPECT_EQ(monitor.currentTier(), QualityTier::POOR);
}

TEST_F(QualityMonitorTest, TierChangeCallbackFiresOnTransitionsOnly) {
    QualityMonitor monitor(1);
    std::vector<std::pair<QualityTier, QualityTier>> changes;

    monitor.setTierChangeCallback([&](QualityTier oldTier, QualityTier newTier) {
        changes.emplace_back(oldTier, newTier);
    });

    monitor.record(-25.0f);   // GOOD, same as initial tier
    monitor.record(-10.0f);   // EXCELLENT
    monitor.record(-12.0f);   // EXCELLENT
    monitor.record(-50.0f);   // POOR

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].first, QualityTier::GOOD);
    EXPECT_EQ(changes[0].second, QualityTier::EXCELLENT);
    EXPECT_EQ(changes[1].first, QualityTier::EXCELLENT);
    EXPECT_EQ(changes[1].second, QualityTier::POOR);
}

TEST_F(QualityMonitorTest, CustomClassifierStrategy) {
    class AlwaysFair : public QualityClassifier {
    public:
        QualityTier classify(float) const override { return QualityTier::FAIR; }
    };

    QualityMonitor monitor(10, std::make_shared<AlwaysFair>());
    monitor.record(0.0f);
    EXPECT_EQ(monitor.currentTier(), QualityTier::FAIR);

    monitor.setClassifier(std::make_shared<ThresholdQualityClassifier>());
    EXPECT_EQ(monitor.currentTier(), QualityTier::EXCELLENT);
}

TEST_F(QualityMonitorTest, ResetClearsWindow) {
    QualityMonitor monitor;
    feed(monitor, -70.0f, 10);

    monitor.reset();

    EXPECT_EQ(monitor.sampleCount(), 0u);
    EXPECT_EQ(monitor.currentTier(), QualityTier::GOOD);
    EXPECT_EQ(qualityTierToString(QualityTier::EXCELLENT), "excellent");
}
