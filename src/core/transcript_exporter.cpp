#include "collabscribe/core/transcript_exporter.hpp"
#include "collabscribe/utils/error_handler.hpp"
#include "collabscribe/utils/time_format.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace collabscribe {
namespace core {

namespace {

nlohmann::ordered_json segmentToJson(const TranscriptionSegment& segment) {
    nlohmann::ordered_json j;
    j["id"] = segment.id;
    j["participantId"] = segment.participantId;
    j["participantName"] = segment.participantName;
    j["content"] = segment.content;
    j["startTime"] = segment.startTime;
    j["endTime"] = segment.endTime;
    j["confidence"] = segment.confidence;
    j["isFinal"] = segment.isFinal;
    j["language"] = segment.language;
    j["createdAt"] = utils::formatIso8601(segment.createdAt);
    j["sessionId"] = segment.sessionId;
    return j;
}

TranscriptionSegment segmentFromJson(const nlohmann::json& j, size_t index) {
    if (!j.is_object()) {
        throw utils::ExportException("Invalid transcript export",
                                     "element " + std::to_string(index) + " is not an object");
    }

    TranscriptionSegment segment;
    segment.id = j.at("id").get<std::string>();
    segment.participantId = j.at("participantId").get<std::string>();
    segment.participantName = j.at("participantName").get<std::string>();
    segment.content = j.at("content").get<std::string>();
    segment.startTime = j.at("startTime").get<double>();
    segment.endTime = j.at("endTime").get<double>();
    segment.confidence = j.at("confidence").get<float>();
    segment.isFinal = j.at("isFinal").get<bool>();
    segment.language = j.at("language").get<std::string>();
    segment.sessionId = j.at("sessionId").get<std::string>();

    const std::string createdAt = j.at("createdAt").get<std::string>();
    if (!utils::parseIso8601(createdAt, segment.createdAt)) {
        throw utils::ExportException("Invalid transcript export",
                                     "element " + std::to_string(index) + " has malformed createdAt '" +
                                     createdAt + "'");
    }
    return segment;
}

} // namespace

std::string exportFormatToString(ExportFormat format) {
    switch (format) {
        case ExportFormat::TEXT: return "text";
        case ExportFormat::SRT: return "srt";
        case ExportFormat::VTT: return "vtt";
        case ExportFormat::JSON: return "json";
    }
    return "text";
}

bool parseExportFormat(const std::string& name, ExportFormat& format) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "text" || lowered == "txt") {
        format = ExportFormat::TEXT;
    } else if (lowered == "srt") {
        format = ExportFormat::SRT;
    } else if (lowered == "vtt") {
        format = ExportFormat::VTT;
    } else if (lowered == "json") {
        format = ExportFormat::JSON;
    } else {
        return false;
    }
    return true;
}

std::string TranscriptExporter::exportTranscript(const std::vector<TranscriptionSegment>& segments, ExportFormat format) {
    switch (format) {
        case ExportFormat::TEXT: return toText(segments);
        case ExportFormat::SRT: return toSrt(segments);
        case ExportFormat::VTT: return toVtt(segments);
        case ExportFormat::JSON: return toJson(segments);
    }
    return toText(segments);
}

std::string TranscriptExporter::exportTranscript(const SegmentLedger& ledger, ExportFormat format) {
    return exportTranscript(ledger.all(), format);
}

std::string TranscriptExporter::toText(const std::vector<TranscriptionSegment>& segments) {
    std::ostringstream out;
    out << "# Collaboration Session Transcription\n\n";

    for (const auto& segment : sorted(segments)) {
        out << "[" << utils::formatMinutesSeconds(segment.startTime) << "] **"
            << segment.participantName << "**: " << segment.content << "\n\n";
    }
    return out.str();
}

std::string TranscriptExporter::toSrt(const std::vector<TranscriptionSegment>& segments) {
    std::ostringstream out;
    size_t index = 1;

    for (const auto& segment : sorted(segments)) {
        out << index++ << "\n"
            << utils::formatSrtTimestamp(segment.startTime) << " --> "
            << utils::formatSrtTimestamp(segment.endTime) << "\n"
            << segment.participantName << ": " << segment.content << "\n\n";
    }
    return out.str();
}

std::string TranscriptExporter::toVtt(const std::vector<TranscriptionSegment>& segments) {
    std::ostringstream out;
    out << "WEBVTT\n\n";

    for (const auto& segment : sorted(segments)) {
        out << utils::formatVttTimestamp(segment.startTime) << " --> "
            << utils::formatVttTimestamp(segment.endTime) << "\n"
            << "<v " << segment.participantName << ">" << segment.content << "\n\n";
    }
    return out.str();
}

std::string TranscriptExporter::toJson(const std::vector<TranscriptionSegment>& segments) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& segment : sorted(segments)) {
        array.push_back(segmentToJson(segment));
    }
    // Recognizer text is not guaranteed to be valid UTF-8
    return array.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::vector<TranscriptionSegment> TranscriptExporter::parseJsonExport(const std::string& json) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw utils::ExportException("Malformed transcript JSON", e.what());
    }

    if (!document.is_array()) {
        throw utils::ExportException("Invalid transcript export", "top-level value is not an array");
    }

    std::vector<TranscriptionSegment> segments;
    segments.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        try {
            segments.push_back(segmentFromJson(document[i], i));
        } catch (const nlohmann::json::exception& e) {
            throw utils::ExportException("Invalid transcript export",
                                         "element " + std::to_string(i) + ": " + e.what());
        }
    }
    return segments;
}

std::vector<TranscriptionSegment> TranscriptExporter::sorted(const std::vector<TranscriptionSegment>& segments) {
    std::vector<TranscriptionSegment> result = segments;
    std::stable_sort(result.begin(), result.end(),
                     [](const TranscriptionSegment& a, const TranscriptionSegment& b) {
                         return a.startTime < b.startTime;
                     });
    return result;
}

std::string exportTranscript(const SegmentLedger& ledger, ExportFormat format) {
    return TranscriptExporter::exportTranscript(ledger, format);
}

std::vector<TranscriptionSegment> parseJsonExport(const std::string& json) {
    return TranscriptExporter::parseJsonExport(json);
}

} // namespace core
} // namespace collabscribe
