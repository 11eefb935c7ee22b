#pragma once

#include "pv_watch/core/anomaly.h"
#include <map>
#include <vector>

namespace pv_watch {
namespace detection {

/**
 * @brief Fixed maintenance advice per anomaly type
 */
class RecommendationCatalog {
public:
    RecommendationCatalog();

    /**
     * @brief Recommendations for an anomaly, most urgent first
     *
     * Critical anomalies raise every entry to at least high priority.
     */
    std::vector<Recommendation> recommend(AnomalyType type, Severity severity) const;

    /**
     * @brief Replace the entries of a type
     */
    void set(AnomalyType type, std::vector<Recommendation> recommendations);

private:
    std::map<AnomalyType, std::vector<Recommendation>> entries_;
};

} // namespace detection
} // namespace pv_watch
