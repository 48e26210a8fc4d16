#include "collabscribe/core/segment_ledger.hpp"
#include "collabscribe/utils/logging.hpp"
#include "collabscribe/utils/time_format.hpp"
#include <algorithm>
#include <cctype>

namespace collabscribe {
namespace core {

namespace {

std::string toLower(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& loweredNeedle) {
    return toLower(haystack).find(loweredNeedle) != std::string::npos;
}

} // namespace

bool SegmentFilter::matches(const TranscriptionSegment& segment) const {
    if (finalOnly && !segment.isFinal) {
        return false;
    }
    if (!participantIds.empty() && participantIds.count(segment.participantId) == 0) {
        return false;
    }
    if (startAfter && segment.startTime < *startAfter) {
        return false;
    }
    if (endBefore && segment.endTime > *endBefore) {
        return false;
    }
    if (minConfidence && segment.confidence < *minConfidence) {
        return false;
    }
    if (!text.empty()) {
        std::string needle = toLower(text);
        if (!containsIgnoreCase(segment.content, needle) &&
            !containsIgnoreCase(segment.participantName, needle)) {
            return false;
        }
    }
    return true;
}

bool SegmentLedger::append(const TranscriptionSegment& segment) {
    if (!segment.isFinal) {
        return replaceActive(segment.participantId, segment);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (rejectIfFrozen("append")) {
        return false;
    }

    TranscriptionSegment stored = segment;
    stored.createdAt = utils::truncateToMillis(segment.createdAt);

    // A replicated final supersedes the interim segment it completes
    auto it = active_.find(segment.participantId);
    if (it != active_.end() && it->second.segment.id == segment.id) {
        uint64_t sequence = it->second.sequence;
        active_.erase(it);
        finalized_.push_back(Entry{sequence, std::move(stored)});
        return true;
    }

    finalized_.push_back(Entry{nextSequence_++, std::move(stored)});
    return true;
}

bool SegmentLedger::replaceActive(const std::string& participantId, const TranscriptionSegment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejectIfFrozen("replaceActive")) {
        return false;
    }

    TranscriptionSegment stored = segment;
    stored.participantId = participantId;
    stored.isFinal = false;
    stored.createdAt = utils::truncateToMillis(segment.createdAt);

    auto it = active_.find(participantId);
    if (it != active_.end()) {
        it->second.segment = std::move(stored);
    } else {
        active_.emplace(participantId, Entry{nextSequence_++, std::move(stored)});
    }
    return true;
}

std::optional<TranscriptionSegment> SegmentLedger::finalize(const std::string& participantId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejectIfFrozen("finalize")) {
        return std::nullopt;
    }

    auto it = active_.find(participantId);
    if (it == active_.end()) {
        return std::nullopt;
    }

    Entry entry = std::move(it->second);
    active_.erase(it);

    entry.segment.isFinal = true;
    finalized_.push_back(entry);
    return entry.segment;
}

bool SegmentLedger::commitFinal(const std::string& participantId, const TranscriptionSegment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejectIfFrozen("commitFinal")) {
        return false;
    }

    TranscriptionSegment committed = segment;
    committed.participantId = participantId;
    committed.isFinal = true;
    committed.createdAt = utils::truncateToMillis(segment.createdAt);

    uint64_t sequence;
    auto it = active_.find(participantId);
    if (it != active_.end()) {
        sequence = it->second.sequence;
        active_.erase(it);
    } else {
        sequence = nextSequence_++;
    }

    finalized_.push_back(Entry{sequence, std::move(committed)});
    return true;
}

std::vector<TranscriptionSegment> SegmentLedger::query(const SegmentFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectSorted(&filter);
}

std::vector<TranscriptionSegment> SegmentLedger::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectSorted(nullptr);
}

std::vector<TranscriptionSegment> SegmentLedger::finalSegments() const {
    SegmentFilter filter;
    filter.finalOnly = true;
    return query(filter);
}

std::optional<TranscriptionSegment> SegmentLedger::activeSegment(const std::string& participantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(participantId);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second.segment;
}

std::vector<std::string> SegmentLedger::activeParticipants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(active_.size());
    for (const auto& pair : active_) {
        result.push_back(pair.first);
    }
    return result;
}

void SegmentLedger::freeze() {
    std::lock_guard<std::mutex> lock(mutex_);
    frozen_ = true;
}

bool SegmentLedger::isFrozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

size_t SegmentLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_.size() + active_.size();
}

size_t SegmentLedger::finalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalized_.size();
}

size_t SegmentLedger::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

bool SegmentLedger::rejectIfFrozen(const char* operation) const {
    if (frozen_) {
        utils::Logger::warn(std::string("SegmentLedger is frozen, rejecting ") + operation);
        return true;
    }
    return false;
}

std::vector<TranscriptionSegment> SegmentLedger::collectSorted(const SegmentFilter* filter) const {
    std::vector<const Entry*> entries;
    entries.reserve(finalized_.size() + active_.size());

    for (const auto& entry : finalized_) {
        if (!filter || filter->matches(entry.segment)) {
            entries.push_back(&entry);
        }
    }
    for (const auto& pair : active_) {
        if (!filter || filter->matches(pair.second.segment)) {
            entries.push_back(&pair.second);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
        if (a->segment.startTime != b->segment.startTime) {
            return a->segment.startTime < b->segment.startTime;
        }
        return a->sequence < b->sequence;
    });

    std::vector<TranscriptionSegment> result;
    result.reserve(entries.size());
    for (const Entry* entry : entries) {
        result.push_back(entry->segment);
    }
    return result;
}

} // namespace core
} // namespace collabscribe
