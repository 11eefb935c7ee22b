#include <gtest/gtest.h>
#include "pv_watch/core/errors.h"
#include "pv_watch/engine/baseline_cache.h"
#include "pv_watch/utils/time_utils.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace pv_watch;
using namespace pv_watch::engine;

namespace {

// Serves `size` hourly records ending at the requested range end
class CountingHistory : public TelemetryHistoryProvider {
public:
    explicit CountingHistory(size_t size, int delay_ms = 0)
        : size_(size), delay_ms_(delay_ms) {}

    std::vector<TelemetryRecord> fetchHistory(const std::string& system_id,
                                              const TimeRange& range) override {
        fetches++;
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        std::vector<TelemetryRecord> records;
        for (size_t i = 0; i < size_; ++i) {
            TelemetryRecord r(system_id, range.end_time - static_cast<int64_t>(size_ - i) * utils::MS_PER_HOUR);
            r.production.ac_power = 4.0 + static_cast<double>(i % 3);
            r.performance.performance_ratio = 0.8;
            records.push_back(r);
        }
        return records;
    }

    std::atomic<size_t> fetches{0};

private:
    size_t size_;
    int delay_ms_;
};

class BrokenHistory : public TelemetryHistoryProvider {
public:
    std::vector<TelemetryRecord> fetchHistory(const std::string&, const TimeRange&) override {
        throw std::runtime_error("connection reset by peer");
    }
};

} // namespace

class BaselineCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = utils::fromCivil(2024, 6, 1) + 12 * utils::MS_PER_HOUR;
    }

    BaselineBuilder builder_{ConfigMap{{"minimum_data_points", "24"}, {"historical_window_days", "30"}}};
    int64_t now_ = 0;
};

TEST_F(BaselineCacheTest, FreshBaselineIsReused) {
    auto history = std::make_shared<CountingHistory>(48);
    BaselineCache cache(history);

    auto first = cache.get("pv-001", builder_, now_);
    auto second = cache.get("pv-001", builder_, now_ + utils::MS_PER_DAY);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->sample_count, 48u);
    EXPECT_EQ(cache.buildCount("pv-001"), 1u);
    EXPECT_EQ(history->fetches.load(), 1u);

    auto forced = cache.get("pv-001", builder_, now_ + utils::MS_PER_DAY, true);
    EXPECT_NE(forced, first);
    EXPECT_EQ(cache.buildCount("pv-001"), 2u);
    EXPECT_EQ(cache.peek("pv-001"), forced);
}

TEST_F(BaselineCacheTest, StaleBaselineIsRebuilt) {
    auto history = std::make_shared<CountingHistory>(48);
    BaselineCache cache(history);

    cache.get("pv-001", builder_, now_);
    cache.get("pv-001", builder_, now_ + 31 * utils::MS_PER_DAY);
    EXPECT_EQ(cache.buildCount("pv-001"), 2u);
}

TEST_F(BaselineCacheTest, ShortHistoryIsRememberedUntilRetry) {
    auto history = std::make_shared<CountingHistory>(5);
    BaselineCache cache(history, utils::MS_PER_HOUR);

    for (int i = 0; i < 5; ++i) {
        try {
            cache.get("pv-001", builder_, now_ + i * 10 * utils::MS_PER_MINUTE);
            FAIL() << "baseline built from 5 records";
        } catch (const InsufficientDataError& e) {
            EXPECT_EQ(e.available(), 5u);
            EXPECT_EQ(e.required(), 24u);
        }
    }
    EXPECT_EQ(history->fetches.load(), 1u);
    EXPECT_EQ(cache.fetchCount("pv-001"), 1u);
    EXPECT_EQ(cache.buildCount("pv-001"), 0u);
    EXPECT_EQ(cache.peek("pv-001"), nullptr);

    // Retry interval elapsed
    EXPECT_THROW(cache.get("pv-001", builder_, now_ + utils::MS_PER_HOUR), InsufficientDataError);
    EXPECT_EQ(history->fetches.load(), 2u);

    // A forced request always fetches
    EXPECT_THROW(cache.get("pv-001", builder_, now_ + utils::MS_PER_HOUR, true),
                 InsufficientDataError);
    EXPECT_EQ(history->fetches.load(), 3u);
}

TEST_F(BaselineCacheTest, ProviderFailureIsUpstreamFetchError) {
    BaselineCache cache(std::make_shared<BrokenHistory>());
    try {
        cache.get("pv-001", builder_, now_);
        FAIL() << "provider failure not reported";
    } catch (const UpstreamFetchError& e) {
        EXPECT_NE(std::string(e.what()).find("connection reset by peer"), std::string::npos);
    }
    EXPECT_EQ(cache.buildCount("pv-001"), 0u);
}

TEST_F(BaselineCacheTest, NoProviderMeansNoData) {
    BaselineCache cache(nullptr);
    EXPECT_THROW(cache.get("pv-001", builder_, now_), InsufficientDataError);
}

TEST_F(BaselineCacheTest, ConcurrentRequestsBuildOnce) {
    auto history = std::make_shared<CountingHistory>(48, 50);
    BaselineCache cache(history);

    std::vector<std::shared_ptr<const Baseline>> results(8);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&, t]() {
            results[t] = cache.get("pv-001", builder_, now_);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(cache.buildCount("pv-001"), 1u);
    EXPECT_EQ(history->fetches.load(), 1u);
    for (const auto& baseline : results) {
        EXPECT_EQ(baseline, results[0]);
    }
}

TEST_F(BaselineCacheTest, SystemsRebuildIndependently) {
    auto history = std::make_shared<CountingHistory>(48);
    BaselineCache cache(history);

    cache.get("pv-001", builder_, now_);
    cache.get("pv-002", builder_, now_);
    EXPECT_EQ(cache.buildCount("pv-001"), 1u);
    EXPECT_EQ(cache.buildCount("pv-002"), 1u);

    cache.remove("pv-001");
    EXPECT_EQ(cache.peek("pv-001"), nullptr);
    EXPECT_EQ(cache.buildCount("pv-001"), 0u);
    EXPECT_NE(cache.peek("pv-002"), nullptr);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
