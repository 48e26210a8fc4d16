#include "collabscribe/core/session_summarizer.hpp"
#include "collabscribe/utils/time_format.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace collabscribe {
namespace core {

SessionSummary SessionSummarizer::summarize(const SegmentLedger& ledger,
                                            const std::string& sessionId,
                                            std::chrono::steady_clock::time_point sessionStartTime,
                                            std::chrono::steady_clock::time_point now,
                                            const std::vector<std::string>& participantIds,
                                            std::chrono::system_clock::time_point generatedAt) {
    double totalDuration = std::chrono::duration<double>(now - sessionStartTime).count();
    if (totalDuration < 0.0) {
        totalDuration = 0.0;
    }
    return summarize(ledger.finalSegments(), sessionId, totalDuration, participantIds, generatedAt);
}

SessionSummary SessionSummarizer::summarize(const std::vector<TranscriptionSegment>& segments,
                                            const std::string& sessionId,
                                            double totalDuration,
                                            const std::vector<std::string>& participantIds,
                                            std::chrono::system_clock::time_point generatedAt) {
    SessionSummary summary;
    summary.sessionId = sessionId;
    summary.totalDuration = totalDuration < 0.0 ? 0.0 : totalDuration;
    summary.generatedAt = generatedAt;

    for (const auto& participantId : participantIds) {
        ParticipantStats& stats = summary.participantStats[participantId];
        stats.participantId = participantId;
    }

    std::map<std::string, double> confidenceSums;
    for (const auto& segment : segments) {
        if (!segment.isFinal) {
            continue;
        }

        ParticipantStats& stats = summary.participantStats[segment.participantId];
        stats.participantId = segment.participantId;
        if (stats.participantName.empty()) {
            stats.participantName = segment.participantName;
        }
        stats.totalSpeakingTime += segment.duration();
        stats.wordCount += countWords(segment.content);
        stats.segmentCount++;
        confidenceSums[segment.participantId] += segment.confidence;
    }

    for (auto& entry : summary.participantStats) {
        ParticipantStats& stats = entry.second;
        if (stats.segmentCount > 0) {
            stats.averageConfidence = static_cast<float>(
                confidenceSums[entry.first] / static_cast<double>(stats.segmentCount));
        }
    }

    return summary;
}

size_t SessionSummarizer::countWords(const std::string& text) {
    std::istringstream stream(text);
    std::string token;
    size_t count = 0;
    while (stream >> token) {
        count++;
    }
    return count;
}

std::string summaryToJson(const SessionSummary& summary) {
    nlohmann::ordered_json j;
    j["sessionId"] = summary.sessionId;
    j["totalDuration"] = summary.totalDuration;
    j["generatedAt"] = utils::formatIso8601(summary.generatedAt);

    nlohmann::ordered_json stats = nlohmann::ordered_json::object();
    for (const auto& entry : summary.participantStats) {
        const ParticipantStats& s = entry.second;
        stats[entry.first] = {
            {"participantName", s.participantName},
            {"totalSpeakingTime", s.totalSpeakingTime},
            {"wordCount", s.wordCount},
            {"averageConfidence", s.averageConfidence},
            {"segmentCount", s.segmentCount}
        };
    }
    j["participantStats"] = stats;

    return j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace core
} // namespace collabscribe
