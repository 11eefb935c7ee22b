#pragma once

#include "pv_watch/core/anomaly.h"
#include "pv_watch/core/telemetry_record.h"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pv_watch {
namespace engine {

/**
 * @brief Query filter for stored anomalies
 *
 * Empty lists match everything.
 */
struct AnomalyFilter {
    std::optional<TimeRange> range;
    std::vector<Severity> severities;
    std::vector<AnomalyStatus> statuses;
    std::optional<bool> acknowledged;
    size_t limit = 100;
};

/**
 * @brief Aggregate detection statistics
 */
struct AnomalyStatistics {
    size_t total = 0;
    std::map<Severity, size_t> by_severity;
    size_t critical = 0;
    size_t false_positives = 0;
    size_t reviewed = 0;           // resolved or false positive
    size_t feedback_count = 0;
    size_t feedback_correct = 0;
    double false_positive_rate = 0.0;
    double mean_score = 0.0;
    std::map<std::string, size_t> by_method;
    double accuracy = 0.0;

    /**
     * @brief Derive rates from the counters
     *
     * Accuracy is the share of feedback marked correct; without feedback, the
     * share of reviewed anomalies that were not false positives; 0 when
     * nothing was reviewed.
     */
    void finalize(double score_sum);
};

/**
 * @brief Bounded anomaly history of one system with lifecycle operations
 *
 * Oldest entries are evicted once capacity is reached and are no longer
 * addressable. Not thread-safe; the engine serialises access per system.
 */
class AnomalyHistory {
public:
    explicit AnomalyHistory(size_t capacity = 1000);

    /**
     * @brief Append an anomaly
     * @return Id of the evicted anomaly, if any
     */
    std::optional<std::string> add(Anomaly anomaly);

    const Anomaly* find(const std::string& id) const;

    /**
     * @brief Mark an anomaly as seen by an operator
     *
     * active -> investigating; records actor, time and optional feedback.
     * @throw InvalidStateTransitionError NOT_FOUND for unknown ids, CONFLICT
     *        when already acknowledged or terminal
     */
    const Anomaly& acknowledge(const std::string& id, const std::string& actor,
                               const std::optional<AnomalyFeedback>& feedback,
                               int64_t now);

    /**
     * @brief Move an anomaly to a new status
     *
     * Allowed: active -> investigating | resolved | false_positive,
     *          investigating -> resolved | false_positive.
     * @return Previous status
     * @throw InvalidStateTransitionError on unknown ids or disallowed moves
     */
    AnomalyStatus setStatus(const std::string& id, AnomalyStatus status, int64_t now);

    /**
     * @brief Matching anomalies, newest first, at most filter.limit
     */
    std::vector<Anomaly> list(const AnomalyFilter& filter) const;

    /**
     * @brief Add this history to running counters
     * @param stats Counters to update
     * @param score_sum Running sum of scores
     */
    void accumulate(AnomalyStatistics& stats, double& score_sum) const;

    size_t size() const { return entries_.size(); }

    size_t capacity() const { return capacity_; }

private:
    Anomaly* lookup(const std::string& id);

    size_t capacity_;
    std::deque<Anomaly> entries_;
    uint64_t first_seq_ = 0;                         // sequence of entries_.front()
    std::unordered_map<std::string, uint64_t> index_; // id -> sequence
};

/**
 * @brief Whether setStatus may move from one status to another
 */
bool isAllowedTransition(AnomalyStatus from, AnomalyStatus to);

} // namespace engine
} // namespace pv_watch
