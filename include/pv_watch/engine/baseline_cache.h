#pragma once

#include "pv_watch/algorithms/baseline_builder.h"
#include "pv_watch/engine/data_providers.h"
#include "pv_watch/utils/time_utils.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pv_watch {
namespace engine {

/**
 * @brief Per-system baseline cache with single-flight rebuilds
 *
 * Concurrent requests for the same system wait for one rebuild and share its
 * result; different systems rebuild independently. A history too short for a
 * baseline is remembered for `retry_interval_ms` of reference time, so later
 * requests fail fast instead of fetching again.
 */
class BaselineCache {
public:
    explicit BaselineCache(std::shared_ptr<TelemetryHistoryProvider> history,
                           int64_t retry_interval_ms = utils::MS_PER_HOUR);

    /**
     * @brief Current baseline of a system, rebuilt when missing or stale
     * @param system_id System to look up
     * @param builder Builder carrying the system's window and minimum size
     * @param now Reference time (record time during detection)
     * @param force Rebuild even if the cached baseline is fresh, and retry a
     *        remembered short history
     * @throw InsufficientDataError when the history is too short
     * @throw UpstreamFetchError when the history provider fails
     */
    std::shared_ptr<const Baseline> get(const std::string& system_id,
                                        const BaselineBuilder& builder,
                                        int64_t now,
                                        bool force = false);

    /**
     * @brief Cached baseline without triggering a rebuild
     */
    std::shared_ptr<const Baseline> peek(const std::string& system_id) const;

    void remove(const std::string& system_id);

    /**
     * @brief Number of completed rebuilds of a system
     */
    size_t buildCount(const std::string& system_id) const;

    /**
     * @brief Number of history fetches issued for a system
     */
    size_t fetchCount(const std::string& system_id) const;

private:
    struct Entry {
        std::mutex build_mutex;
        std::shared_ptr<const Baseline> baseline;
        size_t builds = 0;
        size_t fetches = 0;

        // Last fetch that came back too short
        bool short_history = false;
        int64_t short_checked_at = 0;
        size_t short_available = 0;
    };

    std::shared_ptr<Entry> find(const std::string& system_id) const;

    std::shared_ptr<Entry> entry(const std::string& system_id);

    std::shared_ptr<TelemetryHistoryProvider> history_;
    int64_t retry_interval_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace engine
} // namespace pv_watch
