#pragma once

#include "collabscribe/core/segment_ledger.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

struct ParticipantStats {
    std::string participantId;
    std::string participantName;
    double totalSpeakingTime;     // seconds, sum of final segment durations
    size_t wordCount;
    float averageConfidence;      // 0 when the participant has no final segment
    size_t segmentCount;

    ParticipantStats()
        : totalSpeakingTime(0.0), wordCount(0), averageConfidence(0.0f), segmentCount(0) {}
};

struct SessionSummary {
    std::string sessionId;
    double totalDuration;         // seconds
    std::map<std::string, ParticipantStats> participantStats;
    std::chrono::system_clock::time_point generatedAt;

    SessionSummary() : totalDuration(0.0) {}
};

/**
 * End-of-session aggregation over the final segments of a ledger snapshot
 */
class SessionSummarizer {
public:
    /**
     * Pure function of the ledger snapshot. Every id in participantIds gets an
     * entry, even without segments; participants that only appear in the
     * ledger are included too.
     */
    static SessionSummary summarize(const SegmentLedger& ledger,
                                    const std::string& sessionId,
                                    std::chrono::steady_clock::time_point sessionStartTime,
                                    std::chrono::steady_clock::time_point now,
                                    const std::vector<std::string>& participantIds = {},
                                    std::chrono::system_clock::time_point generatedAt = std::chrono::system_clock::now());

    static SessionSummary summarize(const std::vector<TranscriptionSegment>& segments,
                                    const std::string& sessionId,
                                    double totalDuration,
                                    const std::vector<std::string>& participantIds,
                                    std::chrono::system_clock::time_point generatedAt);

    /**
     * Number of whitespace separated tokens
     */
    static size_t countWords(const std::string& text);
};

/**
 * Pretty-printed JSON rendering of a summary
 */
std::string summaryToJson(const SessionSummary& summary);

} // namespace core
} // namespace collabscribe
