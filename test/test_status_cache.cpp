#include <unity.h>

#include <chrono>

#include "fake_transport.h"
#include "status_cache.h"

using namespace inkshell;
using namespace inkshell::testing;
using namespace std::chrono_literals;

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

// Manually advanced clock.
struct ManualClock {
  StatusCache::Clock::time_point now = StatusCache::Clock::time_point() + std::chrono::hours(1);
  StatusCache::NowFn fn() {
    return [this] { return now; };
  }
};

static DeviceStatus status_with_battery(int battery) {
  DeviceStatus st;
  st.name = "Canvas";
  st.battery_percent = battery;
  return st;
}

static void test_empty_cache_is_stale(void) {
  ManualClock clock;
  StatusCache cache(clock.fn());
  TEST_ASSERT_FALSE(cache.get(std::chrono::hours(24)).has_value());
  TEST_ASSERT_NULL(cache.latest().get());
  TEST_ASSERT_FALSE(cache.age().has_value());
}

static void test_fresh_snapshot_is_returned(void) {
  ManualClock clock;
  StatusCache cache(clock.fn());
  cache.store(status_with_battery(80));
  clock.now += 4s;

  auto st = cache.get(5s);
  TEST_ASSERT_TRUE(st.has_value());
  TEST_ASSERT_EQUAL_INT(80, st->battery_percent);
  TEST_ASSERT_EQUAL_INT64(4000, cache.age()->count());
}

static void test_old_snapshot_is_stale(void) {
  ManualClock clock;
  StatusCache cache(clock.fn());
  cache.store(status_with_battery(80));
  clock.now += 6s;

  TEST_ASSERT_FALSE(cache.get(5s).has_value());
  // still available to callers that accept any age
  TEST_ASSERT_NOT_NULL(cache.latest().get());
  TEST_ASSERT_TRUE(cache.get(6s).has_value());
}

static void test_store_replaces_snapshot_wholesale(void) {
  ManualClock clock;
  StatusCache cache(clock.fn());
  cache.store(status_with_battery(80));
  auto held = cache.latest();
  clock.now += 10s;
  cache.store(status_with_battery(55));

  // earlier readers keep their consistent view
  TEST_ASSERT_EQUAL_INT(80, held->battery_percent);
  TEST_ASSERT_EQUAL_INT(55, cache.latest()->battery_percent);
  TEST_ASSERT_TRUE(cache.get(1s).has_value());
}

static void test_get_makes_no_transport_calls(void) {
  FakeTransport t;
  StatusCache cache;
  DeviceSession s(t, fast_session_options(), &cache);
  cache.get(1s);
  cache.latest();
  TEST_ASSERT_EQUAL_UINT(0, t.call_count());
}

static void test_refresh_collects_info_and_gallery_counts(void) {
  FakeTransport t;
  FakeDevice dev;
  dev.battery = 64;
  dev.galleries["default"]["a.jpg"] = FakeDevice::File{bytes_of("a"), 1};
  dev.galleries["default"]["b.jpg"] = FakeDevice::File{bytes_of("b"), 2};
  dev.galleries["travel"]["c.jpg"] = FakeDevice::File{bytes_of("c"), 3};
  t.set_handler(dev.handler());
  StatusCache cache;
  DeviceSession s(t, fast_session_options(), &cache);

  DeviceStatus out;
  DeviceError err;
  TEST_ASSERT_TRUE(cache.refresh(s, out, err));
  TEST_ASSERT_EQUAL_INT(64, out.battery_percent);
  TEST_ASSERT_EQUAL_STRING("Canvas", out.name.c_str());
  TEST_ASSERT_TRUE(out.galleries_known);
  TEST_ASSERT_EQUAL_UINT(2, out.galleries.size());
  TEST_ASSERT_EQUAL_STRING("default", out.galleries[0].name.c_str());
  TEST_ASSERT_EQUAL_INT(2, out.galleries[0].item_count);
  TEST_ASSERT_EQUAL_STRING("travel", out.galleries[1].name.c_str());
  TEST_ASSERT_EQUAL_INT(1, out.galleries[1].item_count);

  auto cached = cache.get(60s);
  TEST_ASSERT_TRUE(cached.has_value());
  TEST_ASSERT_EQUAL_INT(64, cached->battery_percent);
  TEST_ASSERT_EQUAL_UINT(2, cached->galleries.size());
}

static void test_failed_refresh_keeps_previous_snapshot(void) {
  FakeTransport t;
  t.set_handler([](const Operation&, HttpResponse&, DeviceError& e) { return fail_with(e, ErrorKind::ConnectionRefused); });
  StatusCache cache;
  cache.store(status_with_battery(30));
  DeviceSession s(t, fast_session_options(), &cache);

  DeviceStatus out;
  DeviceError err;
  TEST_ASSERT_FALSE(cache.refresh(s, out, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::Unreachable), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_INT(30, cache.latest()->battery_percent);
}

static void test_malformed_info_is_reported(void) {
  FakeTransport t;
  t.set_handler([](const Operation& op, HttpResponse& out, DeviceError&) {
    out = http_ok(op.kind == OperationKind::RefreshInfo ? "<html>oops</html>" : "{}");
    return true;
  });
  StatusCache cache;
  DeviceSession s(t, fast_session_options());

  DeviceStatus out;
  DeviceError err;
  TEST_ASSERT_FALSE(cache.refresh(s, out, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::MalformedResponse), static_cast<int>(err.kind));
  TEST_ASSERT_NULL(cache.latest().get());
}

static void test_gallery_failure_keeps_previous_galleries(void) {
  FakeTransport t;
  t.set_handler([](const Operation& op, HttpResponse& out, DeviceError& e) {
    if (op.kind == OperationKind::ListGalleries) return fail_with(e, ErrorKind::DeviceBusy, 503);
    out = http_ok(op.kind == OperationKind::RefreshInfo ? "{\"battery\":12}" : "{}");
    return true;
  });
  StatusCache cache;
  DeviceStatus prev;
  prev.galleries.push_back(GallerySummary{"default", 7});
  prev.galleries_known = true;
  cache.store(prev);
  DeviceSession s(t, fast_session_options());

  DeviceStatus out;
  DeviceError err;
  TEST_ASSERT_TRUE(cache.refresh(s, out, err));
  TEST_ASSERT_EQUAL_INT(12, out.battery_percent);
  TEST_ASSERT_TRUE(out.galleries_known);
  TEST_ASSERT_EQUAL_UINT(1, out.galleries.size());
  TEST_ASSERT_EQUAL_INT(7, out.galleries[0].item_count);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_empty_cache_is_stale);
  RUN_TEST(test_fresh_snapshot_is_returned);
  RUN_TEST(test_old_snapshot_is_stale);
  RUN_TEST(test_store_replaces_snapshot_wholesale);
  RUN_TEST(test_get_makes_no_transport_calls);
  RUN_TEST(test_refresh_collects_info_and_gallery_counts);
  RUN_TEST(test_failed_refresh_keeps_previous_snapshot);
  RUN_TEST(test_malformed_info_is_reported);
  RUN_TEST(test_gallery_failure_keeps_previous_galleries);
  return UNITY_END();
}
