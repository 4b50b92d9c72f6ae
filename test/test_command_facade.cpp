#include <unity.h>

#include <string>
#include <vector>

#include "command_facade.h"
#include "fake_transport.h"
#include "fingerprint.h"

using namespace inkshell;
using namespace inkshell::testing;
using namespace std::chrono_literals;

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

struct Rig {
  FakeTransport transport;
  FakeDevice device;
  StatusCache cache;
  DeviceSession session;
  CommandFacade facade;

  static FacadeOptions options() {
    FacadeOptions o;
    o.prepare = passthrough_prepare;
    return o;
  }

  Rig() : session(transport, fast_session_options(), &cache), facade(session, cache, options()) {
    transport.set_handler(device.handler());
  }

  // Bring the device to Awake and forget the calls made so far.
  void awake() {
    DeviceError err;
    TEST_ASSERT_TRUE(facade.wake(err));
    transport.reset();
  }
};

static void test_simple_commands_hit_their_endpoints(void) {
  Rig rig;
  rig.awake();
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.next_image(err));
  TEST_ASSERT_TRUE(rig.facade.clear_screen(err));
  TEST_ASSERT_TRUE(rig.facade.sleep(err));
  auto calls = rig.transport.calls();
  TEST_ASSERT_EQUAL_UINT(3, calls.size());
  TEST_ASSERT_EQUAL(static_cast<int>(OperationKind::NextImage), static_cast<int>(calls[0].kind));
  TEST_ASSERT_EQUAL(static_cast<int>(OperationKind::ClearScreen), static_cast<int>(calls[1].kind));
  TEST_ASSERT_EQUAL(static_cast<int>(OperationKind::Sleep), static_cast<int>(calls[2].kind));
  TEST_ASSERT_EQUAL(static_cast<int>(ConnectivityState::Asleep), static_cast<int>(rig.session.state()));
}

static void test_non_idempotent_commands_are_sent_once_under_timeout(void) {
  Rig rig;
  rig.awake();
  rig.transport.set_handler([](const Operation&, HttpResponse&, DeviceError& e) { return fail_with(e, ErrorKind::Timeout); });

  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.reboot(err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::Timeout), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_UINT(1, rig.transport.count(OperationKind::Reboot));
}

static void test_push_image_is_sent_once_under_timeout(void) {
  Rig rig;
  rig.awake();
  rig.transport.set_handler([](const Operation&, HttpResponse&, DeviceError& e) { return fail_with(e, ErrorKind::Timeout); });

  std::string path;
  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.push_image(bytes_of("jpeg-bytes"), "default", path, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::Timeout), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_UINT(1, rig.transport.call_count());
}

static void test_idempotent_commands_retry_under_timeout(void) {
  Rig rig;
  rig.awake();
  int failures = 0;
  rig.transport.set_handler([&](const Operation& op, HttpResponse& out, DeviceError& e) {
    if (op.kind == OperationKind::UpdateSettings && failures++ < 2) return fail_with(e, ErrorKind::Timeout);
    out = http_ok();
    return true;
  });

  DeviceSettings s;
  s.sleep_duration = 7200;
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.update_settings(s, err));
  TEST_ASSERT_EQUAL_UINT(3, rig.transport.count(OperationKind::UpdateSettings));
}

static void test_empty_settings_are_rejected_locally(void) {
  Rig rig;
  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.update_settings(DeviceSettings{}, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::OperationRejected), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_UINT(0, rig.transport.call_count());
}

static void test_show_requires_a_file(void) {
  Rig rig;
  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.show_image(ShowParams{}, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::OperationRejected), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_UINT(0, rig.transport.call_count());

  ShowParams p;
  p.filename = "a.jpg";
  TEST_ASSERT_TRUE(rig.facade.show_image(p, err));
  TEST_ASSERT_EQUAL_UINT(1, rig.transport.count(OperationKind::ShowImage));
}

static void test_non_utf8_text_reaches_the_wire(void) {
  Rig rig;
  rig.awake();
  std::vector<std::string> bodies;
  rig.transport.set_handler([&bodies](const Operation& op, HttpResponse& out, DeviceError&) {
    HttpRequest req = build_device_request(op);
    bodies.emplace_back(req.body.begin(), req.body.end());
    out = http_ok();
    return true;
  });

  DeviceError err;
  DeviceSettings s;
  s.name = "Caf\xe9";
  TEST_ASSERT_TRUE(rig.facade.update_settings(s, err));
  ShowParams p;
  p.filename = "Caf\xe9.jpg";
  TEST_ASSERT_TRUE(rig.facade.show_image(p, err));

  TEST_ASSERT_EQUAL_UINT(2, bodies.size());
  TEST_ASSERT_EQUAL_STRING("{\"name\":\"Caf\xef\xbf\xbd\"}", bodies[0].c_str());
  TEST_ASSERT_TRUE(bodies[1].find("Caf\xef\xbf\xbd.jpg") != std::string::npos);
}

static void test_push_image_names_file_by_fingerprint(void) {
  Rig rig;
  const auto bytes = bytes_of("some-jpeg-bytes");
  std::string path;
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.push_image(bytes, "", path, err));

  const std::string name = fingerprint_filename(content_fingerprint(bytes));
  TEST_ASSERT_EQUAL_STRING(("/gallerys/default/" + name).c_str(), path.c_str());
  TEST_ASSERT_FALSE(rig.device.file("default", name).empty());
}

static void test_undecodable_push_makes_no_call(void) {
  Rig rig;
  std::string path;
  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.push_image(bytes_of("BAD-bytes"), "default", path, err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::FormatUnsupported), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_UINT(0, rig.transport.call_count());
}

static void test_refresh_info_decodes_status(void) {
  Rig rig;
  rig.device.battery = 71;
  DeviceStatus st;
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.refresh_info(st, err));
  TEST_ASSERT_EQUAL_INT(71, st.battery_percent);
  TEST_ASSERT_EQUAL_INT(1200, st.screen_width);
}

static void test_gallery_listing(void) {
  Rig rig;
  rig.device.galleries["travel"]["x.jpg"] = FakeDevice::File{bytes_of("x"), 5};
  std::vector<GallerySummary> galleries;
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.list_galleries(galleries, err));
  TEST_ASSERT_EQUAL_UINT(2, galleries.size());

  GalleryPage page;
  TEST_ASSERT_TRUE(rig.facade.list_gallery_images("travel", 0, 10, page, err));
  TEST_ASSERT_EQUAL_INT(1, page.total);
  TEST_ASSERT_EQUAL_STRING("x.jpg", page.images[0].name.c_str());
  TEST_ASSERT_EQUAL_INT64(5, page.images[0].time);
}

static void test_status_reads_come_from_cache(void) {
  Rig rig;
  TEST_ASSERT_FALSE(rig.facade.get_status(60s).has_value());

  DeviceStatus st;
  DeviceError err;
  TEST_ASSERT_TRUE(rig.facade.refresh_status(st, err));
  const std::size_t calls = rig.transport.call_count();

  auto cached = rig.facade.get_status(60s);
  TEST_ASSERT_TRUE(cached.has_value());
  TEST_ASSERT_EQUAL_INT(87, cached->battery_percent);
  TEST_ASSERT_EQUAL_UINT(calls, rig.transport.call_count());
}

static void test_errors_come_back_unmodified(void) {
  Rig rig;
  rig.awake();
  rig.transport.set_handler([](const Operation&, HttpResponse& out, DeviceError&) {
    out = http_status(500, "internal");
    return true;
  });
  DeviceError err;
  TEST_ASSERT_FALSE(rig.facade.next_image(err));
  TEST_ASSERT_EQUAL(static_cast<int>(ErrorKind::OperationRejected), static_cast<int>(err.kind));
  TEST_ASSERT_EQUAL_INT(500, err.http_status);
  TEST_ASSERT_EQUAL_STRING("10.0.0.9:80", err.address.c_str());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_simple_commands_hit_their_endpoints);
  RUN_TEST(test_non_idempotent_commands_are_sent_once_under_timeout);
  RUN_TEST(test_push_image_is_sent_once_under_timeout);
  RUN_TEST(test_idempotent_commands_retry_under_timeout);
  RUN_TEST(test_empty_settings_are_rejected_locally);
  RUN_TEST(test_show_requires_a_file);
  RUN_TEST(test_non_utf8_text_reaches_the_wire);
  RUN_TEST(test_push_image_names_file_by_fingerprint);
  RUN_TEST(test_undecodable_push_makes_no_call);
  RUN_TEST(test_refresh_info_decodes_status);
  RUN_TEST(test_gallery_listing);
  RUN_TEST(test_status_reads_come_from_cache);
  RUN_TEST(test_errors_come_back_unmodified);
  return UNITY_END();
}
