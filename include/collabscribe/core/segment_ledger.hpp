#pragma once

#include "collabscribe/core/transcription_segment.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace collabscribe {
namespace core {

/**
 * Combinable (logical AND) query over the ledger. Unset members do not filter.
 */
struct SegmentFilter {
    // Case-insensitive substring over content or participantName
    std::string text;

    // segment.startTime >= startAfter and segment.endTime <= endBefore
    std::optional<double> startAfter;
    std::optional<double> endBefore;

    std::set<std::string> participantIds;
    std::optional<float> minConfidence;
    bool finalOnly = false;

    bool matches(const TranscriptionSegment& segment) const;
};

/**
 * Append-only, time-ordered store of the segments of one session.
 *
 * Holds at most one active (non-final) segment per participant plus the
 * permanently committed final segments. Reads always return segments sorted by
 * startTime ascending with ties in insertion order, so late or out-of-order
 * arrivals are accepted and placed on read. createdAt is stored at millisecond
 * precision. All operations are serialized by a single mutex; after freeze()
 * every mutation is rejected.
 */
class SegmentLedger {
public:
    SegmentLedger() = default;

    SegmentLedger(const SegmentLedger&) = delete;
    SegmentLedger& operator=(const SegmentLedger&) = delete;

    /**
     * Store a segment. Final segments are committed permanently and clear the
     * participant's active slot if it holds the same segment id; a non-final
     * segment is routed to replaceActive for its participant.
     */
    bool append(const TranscriptionSegment& segment);

    /**
     * Overwrite the participant's active segment in place (insert if none).
     * The segment is stored as non-final.
     */
    bool replaceActive(const std::string& participantId, const TranscriptionSegment& segment);

    /**
     * Convert the participant's active segment to final and append it.
     * Returns std::nullopt (and changes nothing) if there is no active segment.
     */
    std::optional<TranscriptionSegment> finalize(const std::string& participantId);

    /**
     * replaceActive followed by finalize as one atomic unit. The committed
     * segment keeps the active slot's position in insertion order.
     */
    bool commitFinal(const std::string& participantId, const TranscriptionSegment& segment);

    std::vector<TranscriptionSegment> query(const SegmentFilter& filter) const;
    std::vector<TranscriptionSegment> all() const;
    std::vector<TranscriptionSegment> finalSegments() const;

    std::optional<TranscriptionSegment> activeSegment(const std::string& participantId) const;
    std::vector<std::string> activeParticipants() const;

    void freeze();
    bool isFrozen() const;

    size_t size() const;
    size_t finalCount() const;
    size_t activeCount() const;

private:
    struct Entry {
        uint64_t sequence;
        TranscriptionSegment segment;
    };

    bool rejectIfFrozen(const char* operation) const;
    std::vector<TranscriptionSegment> collectSorted(const SegmentFilter* filter) const;

    mutable std::mutex mutex_;
    std::vector<Entry> finalized_;
    std::map<std::string, Entry> active_;
    uint64_t nextSequence_ = 0;
    bool frozen_ = false;
};

} // namespace core
} // namespace collabscribe
