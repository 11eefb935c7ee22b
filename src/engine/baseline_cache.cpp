#include "pv_watch/engine/baseline_cache.h"
#include "pv_watch/core/errors.h"
#include <iostream>

namespace pv_watch {
namespace engine {

BaselineCache::BaselineCache(std::shared_ptr<TelemetryHistoryProvider> history,
                             int64_t retry_interval_ms)
    : history_(std::move(history)),
      retry_interval_ms_(retry_interval_ms) {
}

std::shared_ptr<BaselineCache::Entry> BaselineCache::entry(const std::string& system_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = entries_[system_id];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

std::shared_ptr<BaselineCache::Entry> BaselineCache::find(const std::string& system_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(system_id);
    return it != entries_.end() ? it->second : nullptr;
}

std::shared_ptr<const Baseline> BaselineCache::get(const std::string& system_id,
                                                   const BaselineBuilder& builder,
                                                   int64_t now,
                                                   bool force) {
    std::shared_ptr<Entry> e = entry(system_id);

    // Waiters block here while another thread rebuilds, then reuse its result
    std::lock_guard<std::mutex> build_lock(e->build_mutex);
    if (e->baseline && !force && !builder.isStale(*e->baseline, now)) {
        return e->baseline;
    }

    if (e->short_history && !force && now >= e->short_checked_at &&
        now - e->short_checked_at < retry_interval_ms_) {
        throw InsufficientDataError(
            "Baseline for system '" + system_id + "' needs " +
            std::to_string(builder.minimumDataPoints()) + " records, got " +
            std::to_string(e->short_available),
            e->short_available, builder.minimumDataPoints());
    }

    if (!history_) {
        throw InsufficientDataError("No history provider for system '" + system_id + "'",
                                    0, builder.minimumDataPoints());
    }

    TimeRange window(now - builder.historicalWindowMs(), now);
    std::vector<TelemetryRecord> records;
    e->fetches++;
    try {
        records = history_->fetchHistory(system_id, window);
    } catch (const UpstreamFetchError&) {
        throw;
    } catch (const std::exception& ex) {
        throw UpstreamFetchError("History fetch for system '" + system_id +
                                 "' failed: " + ex.what());
    }

    if (records.size() < builder.minimumDataPoints()) {
        e->short_history = true;
        e->short_checked_at = now;
        e->short_available = records.size();
    } else {
        e->short_history = false;
    }

    auto baseline = std::make_shared<const Baseline>(builder.build(system_id, records, now));
    e->baseline = baseline;
    e->builds++;

    std::cout << "[BaselineCache] Rebuilt baseline for " << system_id
              << " from " << baseline->sample_count << " records" << std::endl;
    return baseline;
}

std::shared_ptr<const Baseline> BaselineCache::peek(const std::string& system_id) const {
    std::shared_ptr<Entry> e = find(system_id);
    if (!e) {
        return nullptr;
    }
    std::lock_guard<std::mutex> build_lock(e->build_mutex);
    return e->baseline;
}

void BaselineCache::remove(const std::string& system_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(system_id);
}

size_t BaselineCache::buildCount(const std::string& system_id) const {
    std::shared_ptr<Entry> e = find(system_id);
    if (!e) {
        return 0;
    }
    std::lock_guard<std::mutex> build_lock(e->build_mutex);
    return e->builds;
}

size_t BaselineCache::fetchCount(const std::string& system_id) const {
    std::shared_ptr<Entry> e = find(system_id);
    if (!e) {
        return 0;
    }
    std::lock_guard<std::mutex> build_lock(e->build_mutex);
    return e->fetches;
}

} // namespace engine
} // namespace pv_watch
