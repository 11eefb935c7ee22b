#include "pv_watch/engine/anomaly_history.h"
#include "pv_watch/core/errors.h"
#include <algorithm>

namespace pv_watch {
namespace engine {

void AnomalyStatistics::finalize(double score_sum) {
    mean_score = total > 0 ? score_sum / static_cast<double>(total) : 0.0;
    false_positive_rate = reviewed > 0
        ? static_cast<double>(false_positives) / static_cast<double>(reviewed)
        : 0.0;

    if (feedback_count > 0) {
        accuracy = static_cast<double>(feedback_correct) / static_cast<double>(feedback_count);
    } else if (reviewed > 0) {
        accuracy = static_cast<double>(reviewed - false_positives) / static_cast<double>(reviewed);
    } else {
        accuracy = 0.0;
    }
}

bool isAllowedTransition(AnomalyStatus from, AnomalyStatus to) {
    switch (from) {
        case AnomalyStatus::ACTIVE:
            return to == AnomalyStatus::INVESTIGATING ||
                   to == AnomalyStatus::RESOLVED ||
                   to == AnomalyStatus::FALSE_POSITIVE;
        case AnomalyStatus::INVESTIGATING:
            return to == AnomalyStatus::RESOLVED ||
                   to == AnomalyStatus::FALSE_POSITIVE;
        default:
            return false;
    }
}

AnomalyHistory::AnomalyHistory(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {
}

std::optional<std::string> AnomalyHistory::add(Anomaly anomaly) {
    std::optional<std::string> evicted;
    if (entries_.size() >= capacity_) {
        evicted = entries_.front().id;
        index_.erase(entries_.front().id);
        entries_.pop_front();
        ++first_seq_;
    }

    index_[anomaly.id] = first_seq_ + entries_.size();
    entries_.push_back(std::move(anomaly));
    return evicted;
}

Anomaly* AnomalyHistory::lookup(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[static_cast<size_t>(it->second - first_seq_)];
}

const Anomaly* AnomalyHistory::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[static_cast<size_t>(it->second - first_seq_)];
}

const Anomaly& AnomalyHistory::acknowledge(const std::string& id, const std::string& actor,
                                           const std::optional<AnomalyFeedback>& feedback,
                                           int64_t now) {
    Anomaly* anomaly = lookup(id);
    if (!anomaly) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::NOT_FOUND, id,
                                          "Anomaly " + id + " not found");
    }
    if (anomaly->acknowledged) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::CONFLICT, id,
                                          "Anomaly " + id + " already acknowledged by " +
                                          anomaly->acknowledged_by);
    }
    if (anomaly->isTerminal()) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::CONFLICT, id,
                                          "Anomaly " + id + " is already " +
                                          anomalyStatusToString(anomaly->status));
    }

    anomaly->acknowledged = true;
    anomaly->acknowledged_by = actor;
    anomaly->acknowledged_at = now;
    anomaly->status = AnomalyStatus::INVESTIGATING;

    if (feedback) {
        AnomalyFeedback stored = *feedback;
        stored.submitted_by = actor;
        stored.submitted_at = now;
        anomaly->feedback = stored;
    }

    return *anomaly;
}

AnomalyStatus AnomalyHistory::setStatus(const std::string& id, AnomalyStatus status,
                                        int64_t now) {
    Anomaly* anomaly = lookup(id);
    if (!anomaly) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::NOT_FOUND, id,
                                          "Anomaly " + id + " not found");
    }

    AnomalyStatus previous = anomaly->status;
    if (!isAllowedTransition(previous, status)) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::CONFLICT, id,
                                          "Cannot move anomaly " + id + " from " +
                                          anomalyStatusToString(previous) + " to " +
                                          anomalyStatusToString(status));
    }

    anomaly->status = status;
    if (anomaly->isTerminal()) {
        anomaly->closed_at = now;
    }
    return previous;
}

std::vector<Anomaly> AnomalyHistory::list(const AnomalyFilter& filter) const {
    std::vector<const Anomaly*> matches;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        const Anomaly& anomaly = *it;
        if (filter.range && !filter.range->contains(anomaly.timestamp)) {
            continue;
        }
        if (!filter.severities.empty() &&
            std::find(filter.severities.begin(), filter.severities.end(), anomaly.severity) ==
                filter.severities.end()) {
            continue;
        }
        if (!filter.statuses.empty() &&
            std::find(filter.statuses.begin(), filter.statuses.end(), anomaly.status) ==
                filter.statuses.end()) {
            continue;
        }
        if (filter.acknowledged && anomaly.acknowledged != *filter.acknowledged) {
            continue;
        }
        matches.push_back(&anomaly);
    }

    // Newest first; ties keep the later insertion first
    std::stable_sort(matches.begin(), matches.end(),
                     [](const Anomaly* a, const Anomaly* b) {
                         return a->timestamp > b->timestamp;
                     });

    std::vector<Anomaly> result;
    size_t count = std::min(filter.limit, matches.size());
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(*matches[i]);
    }
    return result;
}

void AnomalyHistory::accumulate(AnomalyStatistics& stats, double& score_sum) const {
    for (const auto& anomaly : entries_) {
        stats.total++;
        stats.by_severity[anomaly.severity]++;
        if (anomaly.severity == Severity::CRITICAL) {
            stats.critical++;
        }
        if (anomaly.isTerminal()) {
            stats.reviewed++;
        }
        if (anomaly.status == AnomalyStatus::FALSE_POSITIVE) {
            stats.false_positives++;
        }
        if (anomaly.feedback) {
            stats.feedback_count++;
            if (anomaly.feedback->correct) {
                stats.feedback_correct++;
            }
        }
        for (const auto& method : anomaly.detected_by) {
            stats.by_method[method]++;
        }
        score_sum += anomaly.score;
    }
}

} // namespace engine
} // namespace pv_watch
