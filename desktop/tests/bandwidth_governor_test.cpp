#include "bandwidth_governor.h"
#include "test_helpers.h"
#include "upload_errors.h"

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

using namespace chunkflow;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static bool test_delay_and_streams() {
    BandwidthGovernor gov(1000);
    TEST_ASSERT(near(gov.delay_seconds(500), 0.5), "500 KB at 1000 KB/s takes 0.5 s");
    TEST_ASSERT(near(gov.delay_seconds(0), 0.0), "empty transfer has no delay");
    TEST_ASSERT(gov.per_stream_kbps(4) == 250, "limit split across streams");
    TEST_ASSERT(gov.per_stream_kbps(1) == 1000, "single stream gets the full limit");

    BandwidthGovernor unlimited(0);
    TEST_ASSERT(unlimited.is_unlimited(), "0 means unlimited");
    TEST_ASSERT(near(unlimited.delay_seconds(1e6), 0.0), "unlimited never delays");
    TEST_ASSERT(unlimited.per_stream_kbps(3) == 0, "unlimited per stream");
    TEST_ASSERT(near(BandwidthGovernor::measure_speed_kbps(300, 2), 150), "measured speed");
    TEST_ASSERT(near(BandwidthGovernor::measure_speed_kbps(300, 0), 0), "zero duration");
    std::cout << "PASS: delay and streams" << std::endl;
    return true;
}

static bool test_streams_share_limit() {
    BandwidthGovernor gov(1000);
    TEST_ASSERT(gov.active_streams() == 0, "no streams open");
    TEST_ASSERT(gov.shared_stream_kbps() == 1000, "idle governor offers the full limit");
    {
        BandwidthGovernor::StreamLease first(&gov, 2);
        TEST_ASSERT(gov.shared_stream_kbps() == 500, "two streams split the limit");
        {
            BandwidthGovernor::StreamLease second(&gov, 3);
            TEST_ASSERT(gov.active_streams() == 5, "streams of both leases counted");
            TEST_ASSERT(gov.shared_stream_kbps() == 200, "five streams split the limit");
        }
        TEST_ASSERT(gov.shared_stream_kbps() == 500, "closed lease returns its share");
    }
    TEST_ASSERT(gov.active_streams() == 0, "every stream returned");
    TEST_ASSERT(gov.shared_stream_kbps() == 1000, "full limit again");

    BandwidthGovernor::StreamLease none(nullptr, 4);
    BandwidthGovernor unlimited(0);
    BandwidthGovernor::StreamLease open(&unlimited, 2);
    TEST_ASSERT(unlimited.shared_stream_kbps() == 0, "unlimited stays unlimited");
    std::cout << "PASS: streams share limit" << std::endl;
    return true;
}

static bool test_limit_clamping() {
    BandwidthGovernor gov(10);
    TEST_ASSERT(gov.limit_kbps() == MIN_BANDWIDTH_KBPS, "low limit clamped to minimum");
    gov.set_limit_kbps(5000000);
    TEST_ASSERT(gov.limit_kbps() == MAX_BANDWIDTH_KBPS, "high limit clamped to maximum");
    gov.set_limit_kbps(0);
    TEST_ASSERT(gov.is_unlimited(), "0 switches to unlimited");

    bool threw = false;
    try {
        gov.set_limit_kbps(-1);
    } catch (const ValidationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "negative limit rejected");

    threw = false;
    try {
        BandwidthGovernor bad(-5);
    } catch (const ValidationError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "negative limit rejected at construction");
    std::cout << "PASS: limit clamping" << std::endl;
    return true;
}

static bool test_adapt() {
    BandwidthGovernor gov(1000);
    gov.adapt(2000);
    TEST_ASSERT(gov.limit_kbps() == 1600, "faster network: follow at 80%");
    gov.adapt(100);
    TEST_ASSERT(gov.limit_kbps() == 100, "slower network: drop to measured");
    gov.adapt(10);
    TEST_ASSERT(gov.limit_kbps() == MIN_BANDWIDTH_KBPS, "never below the minimum");

    BandwidthGovernor unlimited(0);
    unlimited.adapt(10);
    TEST_ASSERT(unlimited.is_unlimited(), "unlimited is not adapted");
    std::cout << "PASS: adapt" << std::endl;
    return true;
}

static bool test_auto_adapt_from_history() {
    auto clock = std::make_shared<ManualClock>();
    BandwidthGovernor gov(1000, BandwidthGovernor::Limits{}, clock);

    for (int i = 0; i < 4; ++i) gov.record_transfer(100 * 1024, 1.0, true);
    TEST_ASSERT(!gov.auto_adapt(), "too few samples");

    gov.record_transfer(100 * 1024, 1.0, true);
    TEST_ASSERT(gov.auto_adapt(), "five slow samples pull the limit down");
    TEST_ASSERT(gov.limit_kbps() == 100, "limit follows the measured speed");

    for (int i = 0; i < 5; ++i) gov.record_transfer(110 * 1024, 1.0, true);
    TEST_ASSERT(!gov.auto_adapt(), "within threshold: unchanged");
    std::cout << "PASS: auto adapt from history" << std::endl;
    return true;
}

static bool test_history_bounds() {
    auto clock = std::make_shared<ManualClock>();
    BandwidthGovernor::Limits limits;
    limits.history_max_entries = 3;
    BandwidthGovernor gov(1000, limits, clock);

    for (int i = 0; i < 5; ++i) gov.record_transfer(1024, 1.0, true);
    TEST_ASSERT(gov.history_size() == 3, "history capped by entry count");

    clock->advance(std::chrono::hours(25));
    gov.record_transfer(1024, 1.0, true);
    TEST_ASSERT(gov.history_size() == 1, "old entries aged out");
    std::cout << "PASS: history bounds" << std::endl;
    return true;
}

static bool test_statistics_and_health() {
    auto clock = std::make_shared<ManualClock>();
    BandwidthGovernor gov(1000, BandwidthGovernor::Limits{}, clock);

    TEST_ASSERT(gov.statistics().window_description == "No data", "empty statistics");
    BandwidthHealthReport report = gov.health_check();
    TEST_ASSERT(report.status == BandwidthHealth::UNDERUTILIZED, "idle link is underutilized");

    gov.record_transfer(500 * 1024, 1.0, true);
    gov.record_transfer(500 * 1024, 1.0, false);
    const BandwidthStats stats = gov.statistics();
    TEST_ASSERT(stats.total_uploads == 2 && stats.successful_uploads == 1, "counts");
    TEST_ASSERT(near(stats.success_rate, 50.0), "success rate");
    TEST_ASSERT(near(stats.average_speed_kbps, 500.0), "average speed");
    TEST_ASSERT(near(stats.efficiency_percentage, 50.0), "efficiency");
    TEST_ASSERT(stats.window_description == "All time", "unbounded window");

    report = gov.health_check();
    TEST_ASSERT(report.status == BandwidthHealth::OPTIMAL, "half the limit is optimal");

    gov.record_transfer(2000 * 1024, 1.0, true);
    report = gov.health_check();
    TEST_ASSERT(report.status == BandwidthHealth::OVERUTILIZED, "above 85% is overutilized");

    clock->advance(std::chrono::minutes(10));
    TEST_ASSERT(gov.statistics(std::chrono::seconds(300)).total_uploads == 0, "window excludes old transfers");
    std::cout << "PASS: statistics and health" << std::endl;
    return true;
}

int main() {
    std::cout << "Running bandwidth governor tests..." << std::endl;
    test::configure_unit_test_runtime();

    test_delay_and_streams();
    test_streams_share_limit();
    test_limit_clamping();
    test_adapt();
    test_auto_adapt_from_history();
    test_history_bounds();
    test_statistics_and_health();

    if (tests_failed == 0) {
        std::cout << "ALL PASS" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
