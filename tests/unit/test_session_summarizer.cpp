#include <gtest/gtest.h>
#include "collabscribe/core/session_summarizer.hpp"
#include <nlohmann/json.hpp>

using namespace collabscribe::core;

class SessionSummarizerTest : public ::testing::Test {
protected:
    static std::string words(size_t count) {
        std::string text;
        for (size_t i = 0; i < count; ++i) {
            if (!text.empty()) {
                text += ' ';
            }
            text += "word" + std::to_string(i);
        }
        return text;
    }

    static TranscriptionSegment segment(const std::string& participantId, const std::string& name,
                                        const std::string& content, double start, double end,
                                        float confidence, bool isFinal = true) {
        TranscriptionSegment s;
        s.id = participantId + "-" + std::to_string(start);
        s.participantId = participantId;
        s.participantName = name;
        s.content = content;
        s.startTime = start;
        s.endTime = end;
        s.confidence = confidence;
        s.isFinal = isFinal;
        s.sessionId = "standup";
        return s;
    }

    std::chrono::system_clock::time_point generatedAt{std::chrono::seconds(1792227600)};
};

TEST_F(SessionSummarizerTest, AggregatesPerParticipant) {
    std::vector<TranscriptionSegment> segments = {
        segment("alice", "Alice", words(20), 0.0, 12.5, 0.9f),
        segment("bob", "Bob", words(5), 13.0, 15.0, 0.8f),
        segment("alice", "Alice", words(22), 20.0, 35.0, 0.8f),
        segment("alice", "Alice", words(20), 60.0, 72.7, 0.7f),
    };

    SessionSummary summary = SessionSummarizer::summarize(segments, "standup", 125.4, {"alice", "bob"},
                                                          generatedAt);

    EXPECT_EQ(summary.sessionId, "standup");
    EXPECT_DOUBLE_EQ(summary.totalDuration, 125.4);
    ASSERT_EQ(summary.participantStats.size(), 2u);

    const ParticipantStats& alice = summary.participantStats.at("alice");
    EXPECT_EQ(alice.participantName, "Alice");
    EXPECT_NEAR(alice.totalSpeakingTime, 40.2, 1e-9);
    EXPECT_EQ(alice.wordCount, 62u);
    EXPECT_EQ(alice.segmentCount, 3u);
    EXPECT_NEAR(alice.averageConfidence, 0.8f, 1e-6);

    const ParticipantStats& bob = summary.participantStats.at("bob");
    EXPECT_EQ(bob.wordCount, 5u);
    EXPECT_NEAR(bob.totalSpeakingTime, 2.0, 1e-9);
}

TEST_F(SessionSummarizerTest, InterimSegmentsAreIgnored) {
    std::vector<TranscriptionSegment> segments = {
        segment("alice", "Alice", "final words here", 0.0, 3.0, 0.9f),
        segment("alice", "Alice", "still being spoken", 4.0, 6.0, 0.8f, false),
    };

    SessionSummary summary = SessionSummarizer::summarize(segments, "standup", 10.0, {}, generatedAt);

    const ParticipantStats& alice = summary.participantStats.at("alice");
    EXPECT_EQ(alice.segmentCount, 1u);
    EXPECT_EQ(alice.wordCount, 3u);
    EXPECT_DOUBLE_EQ(alice.totalSpeakingTime, 3.0);
}

TEST_F(SessionSummarizerTest, SilentParticipantHasZeroStats) {
    SessionSummary summary = SessionSummarizer::summarize({}, "standup", 30.0, {"carol"}, generatedAt);

    ASSERT_EQ(summary.participantStats.count("carol"), 1u);
    const ParticipantStats& carol = summary.participantStats.at("carol");
    EXPECT_EQ(carol.segmentCount, 0u);
    EXPECT_EQ(carol.wordCount, 0u);
    EXPECT_FLOAT_EQ(carol.averageConfidence, 0.0f);
}

TEST_F(SessionSummarizerTest, SummarizesLedgerSnapshot) {
    SegmentLedger ledger;
    ledger.append(segment("alice", "Alice", "one two", 1.0, 2.0, 0.9f));
    ledger.replaceActive("bob", segment("bob", "Bob", "pending", 3.0, 4.0, 0.5f, false));

    auto start = std::chrono::steady_clock::time_point(std::chrono::seconds(100));
    auto now = start + std::chrono::milliseconds(125400);

    SessionSummary summary = SessionSummarizer::summarize(ledger, "standup", start, now, {"alice", "bob"},
                                                          generatedAt);

    EXPECT_NEAR(summary.totalDuration, 125.4, 1e-9);
    EXPECT_EQ(summary.participantStats.at("alice").wordCount, 2u);
    EXPECT_EQ(summary.participantStats.at("bob").segmentCount, 0u);
}

TEST_F(SessionSummarizerTest, NegativeDurationIsClamped) {
    auto start = std::chrono::steady_clock::time_point(std::chrono::seconds(100));
    SegmentLedger ledger;

    SessionSummary summary = SessionSummarizer::summarize(ledger, "standup", start,
                                                          start - std::chrono::seconds(5), {}, generatedAt);

    EXPECT_DOUBLE_EQ(summary.totalDuration, 0.0);
}

TEST_F(SessionSummarizerTest, CountsWhitespaceSeparatedWords) {
    EXPECT_EQ(SessionSummarizer::countWords(""), 0u);
    EXPECT_EQ(SessionSummarizer::countWords("   "), 0u);
    EXPECT_EQ(SessionSummarizer::countWords("hello"), 1u);
    EXPECT_EQ(SessionSummarizer::countWords("  we should\tship it\n today "), 5u);
}

TEST_F(SessionSummarizerTest, JsonRenderingCarriesAllFields) {
    std::vector<TranscriptionSegment> segments = {
        segment("alice", "Alice", "one two three", 0.0, 4.0, 0.75f),
    };
    SessionSummary summary = SessionSummarizer::summarize(segments, "standup", 60.0, {"alice"}, generatedAt);

    auto j = nlohmann::json::parse(summaryToJson(summary));

    EXPECT_EQ(j["sessionId"], "standup");
    EXPECT_DOUBLE_EQ(j["totalDuration"].get<double>(), 60.0);
    EXPECT_EQ(j["generatedAt"], "2026-10-17T09:00:00.000Z");
    const auto& alice = j["participantStats"]["alice"];
    EXPECT_EQ(alice["participantName"], "Alice");
    EXPECT_EQ(alice["wordCount"].get<size_t>(), 3u);
    EXPECT_EQ(alice["segmentCount"].get<size_t>(), 1u);
    EXPECT_DOUBLE_EQ(alice["totalSpeakingTime"].get<double>(), 4.0);
    EXPECT_NEAR(alice["averageConfidence"].get<double>(), 0.75, 1e-6);
}
