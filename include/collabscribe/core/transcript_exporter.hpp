#pragma once

#include "collabscribe/core/segment_ledger.hpp"
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

enum class ExportFormat {
    TEXT,
    SRT,
    VTT,
    JSON
};

std::string exportFormatToString(ExportFormat format);

/**
 * Accepts "text"/"txt", "srt", "vtt", "json" (case-insensitive)
 */
bool parseExportFormat(const std::string& name, ExportFormat& format);

/**
 * Deterministic rendering of transcription segments. Segments are emitted in
 * startTime order across participants; equal start times keep input order.
 */
class TranscriptExporter {
public:
    static std::string exportTranscript(const std::vector<TranscriptionSegment>& segments, ExportFormat format);
    static std::string exportTranscript(const SegmentLedger& ledger, ExportFormat format);

    static std::string toText(const std::vector<TranscriptionSegment>& segments);
    static std::string toSrt(const std::vector<TranscriptionSegment>& segments);
    static std::string toVtt(const std::vector<TranscriptionSegment>& segments);
    static std::string toJson(const std::vector<TranscriptionSegment>& segments);

    /**
     * Inverse of the JSON export. Throws utils::ExportException on malformed
     * JSON, a non-array document, missing or mistyped fields, or an invalid
     * createdAt timestamp.
     */
    static std::vector<TranscriptionSegment> parseJsonExport(const std::string& json);

private:
    static std::vector<TranscriptionSegment> sorted(const std::vector<TranscriptionSegment>& segments);
};

/**
 * Free-function shorthands of TranscriptExporter
 */
std::string exportTranscript(const SegmentLedger& ledger, ExportFormat format);
std::vector<TranscriptionSegment> parseJsonExport(const std::string& json);

} // namespace core
} // namespace collabscribe
