#include <gtest/gtest.h>
#include "collabscribe/core/recognition_event_processor.hpp"
#include "fixtures/manual_clock.hpp"
#include <cmath>
#include <limits>
#include <tuple>
#include <vector>

using namespace collabscribe::core;

class RecognitionEventProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<fixtures::ManualClock>();
        registry.add("alice", "Alice");
        registry.add("bob", "Bob");

        processor = std::make_unique<RecognitionEventProcessor>(
            registry, ledger, clock, clock->now(), "session-1", diagnostics);
        processor->setSegmentPublisher([this](TranscriptionEventType type,
                                              const TranscriptionSegment& segment,
                                              bool broadcast) {
            published.emplace_back(type, segment, broadcast);
        });
    }

    std::shared_ptr<fixtures::ManualClock> clock;
    ParticipantRegistry registry;
    SegmentLedger ledger;
    IngestionDiagnostics diagnostics;
    std::unique_ptr<RecognitionEventProcessor> processor;
    std::vector<std::tuple<TranscriptionEventType, TranscriptionSegment, bool>> published;
};

TEST_F(RecognitionEventProcessorTest, PartialsUpdateBufferOnly) {
    clock->advanceSeconds(1.0);
    EXPECT_TRUE(processor->onPartial("alice", "I", 0.5f));
    clock->advanceSeconds(0.5);
    EXPECT_TRUE(processor->onPartial("alice", "I think", 0.6f));

    const ParticipantState* state = registry.find("alice");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->interimBuffer, "I think");
    ASSERT_TRUE(state->utteranceStartTime.has_value());
    EXPECT_DOUBLE_EQ(*state->utteranceStartTime, 1.0);

    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(published.empty());
}

TEST_F(RecognitionEventProcessorTest, PartialFlushFinalProducesOneSegment) {
    clock->advanceSeconds(1.0);
    processor->onPartial("alice", "I", 0.5f);
    clock->advanceSeconds(0.5);
    processor->onPartial("alice", "I think", 0.6f);

    EXPECT_EQ(processor->flushInterim(0.8f), 1u);
    auto interim = ledger.activeSegment("alice");
    ASSERT_TRUE(interim.has_value());
    EXPECT_EQ(interim->content, "I think");
    EXPECT_FALSE(interim->isFinal);
    EXPECT_FLOAT_EQ(interim->confidence, 0.8f);

    clock->advanceSeconds(0.5);
    processor->onPartial("alice", "I think we", 0.7f);
    EXPECT_EQ(processor->flushInterim(0.8f), 1u);

    clock->advanceSeconds(1.0);
    EXPECT_TRUE(processor->onFinal("alice", "I think we should proceed", 0.92f));

    auto all = ledger.all();
    ASSERT_EQ(all.size(), 1u);
    const auto& segment = all[0];
    EXPECT_TRUE(segment.isFinal);
    EXPECT_EQ(segment.content, "I think we should proceed");
    EXPECT_EQ(segment.participantName, "Alice");
    EXPECT_EQ(segment.sessionId, "session-1");
    EXPECT_DOUBLE_EQ(segment.startTime, 1.0);
    EXPECT_DOUBLE_EQ(segment.endTime, 3.0);
    EXPECT_FLOAT_EQ(segment.confidence, 0.92f);
    EXPECT_EQ(segment.id, interim->id);

    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(std::get<0>(published[0]), TranscriptionEventType::SEGMENT_STARTED);
    EXPECT_EQ(std::get<0>(published[1]), TranscriptionEventType::SEGMENT_UPDATED);
    EXPECT_EQ(std::get<0>(published[2]), TranscriptionEventType::SEGMENT_FINALIZED);
    EXPECT_TRUE(std::get<2>(published[2]));

    const ParticipantState* state = registry.find("alice");
    EXPECT_TRUE(state->interimBuffer.empty());
    EXPECT_FALSE(state->utteranceStartTime.has_value());
    EXPECT_TRUE(state->activeSegmentId.empty());
}

TEST_F(RecognitionEventProcessorTest, FinalWithoutFlushCommitsDirectly) {
    clock->advanceSeconds(2.0);
    processor->onPartial("bob", "quick note", 0.4f);
    clock->advanceSeconds(1.0);
    EXPECT_TRUE(processor->onFinal("bob", "quick note taken", 0.9f));

    auto all = ledger.all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_FALSE(all[0].id.empty());
    EXPECT_DOUBLE_EQ(all[0].startTime, 2.0);
    EXPECT_DOUBLE_EQ(all[0].endTime, 3.0);
}

TEST_F(RecognitionEventProcessorTest, FinalWithoutPartialStartsNow) {
    clock->advanceSeconds(4.0);
    EXPECT_TRUE(processor->onFinal("alice", "standalone", 0.9f));

    auto all = ledger.all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_DOUBLE_EQ(all[0].startTime, 4.0);
    EXPECT_DOUBLE_EQ(all[0].endTime, 4.0);
}

TEST_F(RecognitionEventProcessorTest, EmptyFinalUsesBufferedHypothesis) {
    processor->onPartial("alice", "buffered words", 0.5f);
    clock->advanceSeconds(1.0);

    EXPECT_TRUE(processor->onFinal("alice", "", 0.7f));

    auto all = ledger.all();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].content, "buffered words");
}

TEST_F(RecognitionEventProcessorTest, EmptyEventsAreDropped) {
    EXPECT_FALSE(processor->onPartial("alice", "", 0.5f));
    EXPECT_FALSE(processor->onFinal("alice", "", 0.5f));

    EXPECT_EQ(diagnostics.emptyEvents.load(), 2u);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(RecognitionEventProcessorTest, UnknownAndPausedParticipantsAreDropped) {
    EXPECT_FALSE(processor->onPartial("mallory", "hello", 0.9f));
    EXPECT_FALSE(processor->onFinal("mallory", "hello", 0.9f));
    EXPECT_EQ(diagnostics.unknownParticipantEvents.load(), 2u);

    registry.find("bob")->micEnabled = false;
    EXPECT_FALSE(processor->onPartial("bob", "muted", 0.9f));
    EXPECT_FALSE(processor->onFinal("bob", "muted", 0.9f));
    EXPECT_EQ(diagnostics.micDisabledEvents.load(), 2u);

    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(registry.find("bob")->interimBuffer.empty());
}

TEST_F(RecognitionEventProcessorTest, ConfidenceIsClampedIntoUnitRange) {
    processor->onFinal("alice", "too sure", 1.7f);
    processor->onFinal("alice", "negative", -0.2f);
    processor->onFinal("alice", "undefined", std::numeric_limits<float>::quiet_NaN());

    auto all = ledger.all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_FLOAT_EQ(all[0].confidence, 1.0f);
    EXPECT_FLOAT_EQ(all[1].confidence, 0.0f);
    EXPECT_FLOAT_EQ(all[2].confidence, 0.0f);
    EXPECT_EQ(diagnostics.clampedValues.load(), 3u);
}

TEST_F(RecognitionEventProcessorTest, OutOfRangePartialConfidenceIsCountedOnly) {
    EXPECT_TRUE(processor->onPartial("alice", "still talking", 2.5f));
    EXPECT_TRUE(processor->onPartial("alice", "still talking here", 0.4f));

    EXPECT_EQ(diagnostics.clampedValues.load(), 1u);
    EXPECT_EQ(registry.find("alice")->interimBuffer, "still talking here");
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(RecognitionEventProcessorTest, FlushSkipsPausedAndEmptyBuffers) {
    processor->onPartial("alice", "speaking", 0.5f);
    processor->onPartial("bob", "also speaking", 0.5f);
    registry.find("bob")->micEnabled = false;

    EXPECT_EQ(processor->flushInterim(0.8f), 1u);
    EXPECT_TRUE(ledger.activeSegment("alice").has_value());
    EXPECT_FALSE(ledger.activeSegment("bob").has_value());

    // Nothing new buffered for bob, nothing to write for a paused participant
    EXPECT_EQ(ledger.activeCount(), 1u);
}

TEST_F(RecognitionEventProcessorTest, FinalizePendingCommitsBuffer) {
    clock->advanceSeconds(1.0);
    processor->onPartial("alice", "unfinished thought", 0.5f);
    clock->advanceSeconds(2.0);

    auto finalized = processor->finalizePending("alice", 0.8f);

    ASSERT_TRUE(finalized.has_value());
    EXPECT_TRUE(finalized->isFinal);
    EXPECT_EQ(finalized->content, "unfinished thought");
    EXPECT_DOUBLE_EQ(finalized->startTime, 1.0);
    EXPECT_DOUBLE_EQ(finalized->endTime, 3.0);
    EXPECT_EQ(ledger.finalCount(), 1u);
    EXPECT_EQ(ledger.activeCount(), 0u);
}

TEST_F(RecognitionEventProcessorTest, FinalizePendingFallsBackToActiveSegment) {
    processor->onPartial("alice", "flushed", 0.5f);
    processor->flushInterim(0.8f);
    registry.find("alice")->interimBuffer.clear();

    auto finalized = processor->finalizePending("alice", 0.8f);

    ASSERT_TRUE(finalized.has_value());
    EXPECT_EQ(finalized->content, "flushed");
    EXPECT_EQ(ledger.finalCount(), 1u);
    EXPECT_EQ(std::get<0>(published.back()), TranscriptionEventType::SEGMENT_FINALIZED);
}

TEST_F(RecognitionEventProcessorTest, FinalizePendingWithoutStartTimeIsCounted) {
    registry.find("alice")->interimBuffer = "orphaned";
    clock->advanceSeconds(5.0);

    auto finalized = processor->finalizePending("alice", 0.8f);

    ASSERT_TRUE(finalized.has_value());
    EXPECT_DOUBLE_EQ(finalized->startTime, 5.0);
    EXPECT_EQ(diagnostics.stopInconsistencies.load(), 1u);
}

TEST_F(RecognitionEventProcessorTest, FinalizePendingWithNothingIsNoOp) {
    EXPECT_FALSE(processor->finalizePending("alice", 0.8f).has_value());
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(published.empty());
}

TEST_F(RecognitionEventProcessorTest, FrozenLedgerRejectsFinal) {
    ledger.freeze();

    EXPECT_FALSE(processor->onFinal("alice", "too late", 0.9f));
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(published.empty());
}
