#include "counter_store.h"
#include "rate_limiter.h"
#include "session_repository.h"
#include "test_helpers.h"
#include "upload_errors.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

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

// Start of an hour so bucket boundaries are predictable
static std::shared_ptr<ManualClock> hour_aligned_clock() {
    return std::make_shared<ManualClock>(SystemTime(std::chrono::hours(480000)));
}

// Returns the rejected limit type, or nullopt when admitted
static std::optional<RateLimitType> try_create(RateLimiter& limiter, const std::string& user,
                                               const std::string& ip) {
    try {
        limiter.check_session_creation(user, ip);
    } catch (const RateLimitExceeded& e) {
        return e.limit_type();
    }
    return std::nullopt;
}

static bool test_user_sessions_per_hour() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    RateLimits limits;
    limits.user_sessions_per_hour = 3;
    limits.concurrent_sessions_per_user = 100;
    limits.concurrent_sessions_per_ip = 100;
    RateLimiter limiter(store, limits, clock);

    for (int i = 0; i < 3; ++i) {
        TEST_ASSERT(!try_create(limiter, "u1", "1.1.1.1"), "session within hourly limit admitted");
    }

    clock->advance(std::chrono::minutes(10));
    bool threw = false;
    try {
        limiter.check_session_creation("u1", "1.1.1.1");
    } catch (const RateLimitExceeded& e) {
        threw = e.limit_type() == RateLimitType::USER_SESSIONS;
        TEST_ASSERT(e.retry_after() == 50 * 60, "retry_after points at the next hour");
    }
    TEST_ASSERT(threw, "fourth session in the hour rejected");
    TEST_ASSERT(!try_create(limiter, "u2", "1.1.1.2"), "other users unaffected");

    clock->advance(std::chrono::minutes(50));
    TEST_ASSERT(!try_create(limiter, "u1", "1.1.1.1"), "new hour bucket admits again");
    std::cout << "PASS: user sessions per hour" << std::endl;
    return true;
}

static bool test_check_order_is_deterministic() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    RateLimits limits;
    limits.user_sessions_per_hour = 1;
    limits.ip_sessions_per_hour = 1;
    limits.concurrent_sessions_per_user = 1;
    limits.concurrent_sessions_per_ip = 1;
    RateLimiter limiter(store, limits, clock);

    TEST_ASSERT(!try_create(limiter, "u1", "ip"), "first admitted");
    auto rejected = try_create(limiter, "u1", "ip");
    TEST_ASSERT(rejected && *rejected == RateLimitType::USER_SESSIONS, "user sessions checked first");
    rejected = try_create(limiter, "u2", "ip");
    TEST_ASSERT(rejected && *rejected == RateLimitType::IP_SESSIONS, "ip sessions checked second");
    std::cout << "PASS: check order is deterministic" << std::endl;
    return true;
}

static bool test_concurrency_slots() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    RateLimits limits;
    limits.concurrent_sessions_per_user = 2;
    RateLimiter limiter(store, limits, clock);

    TEST_ASSERT(!try_create(limiter, "u1", "ip"), "slot 1");
    TEST_ASSERT(!try_create(limiter, "u1", "ip"), "slot 2");
    auto rejected = try_create(limiter, "u1", "ip");
    TEST_ASSERT(rejected && *rejected == RateLimitType::CONCURRENT_USER, "third concurrent rejected");
    TEST_ASSERT(limiter.status("u1", "ip").concurrent_user_sessions == 2, "rejected creation holds no slot");

    // Concurrency slots outlive the hourly window
    clock->advance(std::chrono::hours(3));
    TEST_ASSERT(limiter.status("u1", "ip").concurrent_user_sessions == 2, "slots do not expire");

    limiter.track_session_completion("u1", "ip");
    TEST_ASSERT(!try_create(limiter, "u1", "ip"), "released slot reusable");

    limiter.track_session_completion("u1", "ip");
    limiter.track_session_completion("u1", "ip");
    limiter.track_session_completion("u1", "ip");
    TEST_ASSERT(limiter.status("u1", "ip").concurrent_user_sessions == 0, "release floors at zero");
    std::cout << "PASS: concurrency slots" << std::endl;
    return true;
}

static bool test_release_session_slot_once() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    RateLimiter limiter(store, RateLimits{}, clock);
    SessionRepository repo(clock);

    UploadSession s = test::make_session("a.wav", 10, 1);
    limiter.check_session_creation(s.user_id, s.ip_address);
    limiter.check_session_creation(s.user_id, s.ip_address);
    s = repo.create_session(s);

    TEST_ASSERT(release_session_slot(repo, &limiter, s.id), "first release frees the slot");
    TEST_ASSERT(!release_session_slot(repo, &limiter, s.id), "second release is a no-op");
    TEST_ASSERT(limiter.status(s.user_id, s.ip_address).concurrent_user_sessions == 1, "only one slot freed");
    TEST_ASSERT(!release_session_slot(repo, nullptr, s.id), "no limiter, nothing to release");
    TEST_ASSERT(!release_session_slot(repo, &limiter, "missing"), "unknown session");
    std::cout << "PASS: release session slot once" << std::endl;
    return true;
}

static bool test_chunk_limits() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    RateLimits limits;
    limits.chunks_per_session = 3;
    limits.chunks_per_minute = 5;
    limits.user_bandwidth_per_hour = 1000;
    RateLimiter limiter(store, limits, clock);

    for (int i = 0; i < 3; ++i) limiter.check_chunk_upload("u1", "ip", "s1", 10);
    bool threw = false;
    try {
        limiter.check_chunk_upload("u1", "ip", "s1", 10);
    } catch (const RateLimitExceeded& e) {
        threw = e.limit_type() == RateLimitType::SESSION_CHUNKS && e.retry_after() == 0;
    }
    TEST_ASSERT(threw, "fourth chunk of session rejected");

    limiter.check_chunk_upload("u1", "ip", "s2", 10);
    threw = false;
    try {
        limiter.check_chunk_upload("u1", "ip", "s3", 10);
    } catch (const RateLimitExceeded& e) {
        threw = e.limit_type() == RateLimitType::CHUNK_FREQUENCY;
    }
    TEST_ASSERT(threw, "sixth chunk in the minute rejected");

    clock->advance(std::chrono::minutes(1));
    threw = false;
    try {
        limiter.check_chunk_upload("u1", "ip", "s4", 2000);
    } catch (const RateLimitExceeded& e) {
        threw = e.limit_type() == RateLimitType::USER_BANDWIDTH;
    }
    TEST_ASSERT(threw, "bandwidth over the hourly budget rejected");

    limiter.reset("u1", "ip");
    TEST_ASSERT(limiter.status("u1", "ip").user_bandwidth_used == 0, "reset clears counters");
    std::cout << "PASS: chunk limits" << std::endl;
    return true;
}

static bool test_counter_store_expiry() {
    auto clock = hour_aligned_clock();
    InMemoryCounterStore store(clock);
    store.increment("a", std::chrono::seconds(60));
    store.increment("a", std::chrono::seconds(60), 4);
    store.increment("b", std::chrono::seconds(0));
    TEST_ASSERT(store.get("a") == 5, "amounts accumulate");

    clock->advance(std::chrono::seconds(30));
    store.increment("a", std::chrono::seconds(60));
    clock->advance(std::chrono::seconds(31));
    TEST_ASSERT(store.get("a") == 0, "expiry is not extended by later increments");
    TEST_ASSERT(store.get("b") == 1, "zero ttl never expires");
    TEST_ASSERT(store.purge_expired() == 1, "expired entry purged");
    TEST_ASSERT(store.reset("") == 1, "reset everything");
    std::cout << "PASS: counter store expiry" << std::endl;
    return true;
}

int main() {
    std::cout << "Running rate limiter tests..." << std::endl;
    test::configure_unit_test_runtime();

    test_user_sessions_per_hour();
    test_check_order_is_deterministic();
    test_concurrency_slots();
    test_release_session_slot_once();
    test_chunk_limits();
    test_counter_store_expiry();

    if (tests_failed == 0) {
        std::cout << "ALL PASS" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
