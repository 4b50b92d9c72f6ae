#include <unity.h>

#include <string>

#include "device_protocol.h"

using namespace inkshell;

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

static std::string body_of(const HttpRequest& r) {
  return std::string(r.body.begin(), r.body.end());
}

static void test_simple_endpoints(void) {
  struct Case { OperationKind kind; const char* method; const char* target; };
  const Case cases[] = {
    {OperationKind::RefreshInfo, "GET", "/deviceInfo"},
    {OperationKind::NextImage, "POST", "/showNext"},
    {OperationKind::Sleep, "POST", "/sleep"},
    {OperationKind::Reboot, "POST", "/reboot"},
    {OperationKind::ClearScreen, "POST", "/clearScreen"},
    {OperationKind::Wake, "GET", "/whistle"},
    {OperationKind::ListGalleries, "GET", "/gallery/list"},
  };
  for (const Case& c : cases) {
    HttpRequest r = build_device_request(make_operation(c.kind));
    TEST_ASSERT_EQUAL_STRING_MESSAGE(c.method, r.method.c_str(), operation_name(c.kind));
    TEST_ASSERT_EQUAL_STRING_MESSAGE(c.target, r.target.c_str(), operation_name(c.kind));
    TEST_ASSERT_TRUE(r.body.empty());
  }
}

static void test_settings_body_has_only_given_fields(void) {
  Operation op = make_operation(OperationKind::UpdateSettings);
  op.settings.sleep_duration = 7200;
  op.settings.name = "Hall";
  HttpRequest r = build_device_request(op);
  TEST_ASSERT_EQUAL_STRING("POST", r.method.c_str());
  TEST_ASSERT_EQUAL_STRING("/settings", r.target.c_str());
  TEST_ASSERT_EQUAL_STRING("application/json", r.content_type.c_str());
  TEST_ASSERT_EQUAL_STRING("{\"name\":\"Hall\",\"sleep_duration\":7200}", body_of(r).c_str());

  DeviceSettings all;
  all.max_idle = 120;
  all.wake_sensitivity = 2;
  TEST_ASSERT_EQUAL_STRING("{\"idx_wake_sens\":2,\"max_idle\":120}", encode_settings_json(all).c_str());
}

static void test_invalid_utf8_text_is_replaced(void) {
  DeviceSettings s;
  s.name = "Caf\xe9";
  TEST_ASSERT_EQUAL_STRING("{\"name\":\"Caf\xef\xbf\xbd\"}", encode_settings_json(s).c_str());

  ShowParams p;
  p.gallery = "default";
  p.filename = "Caf\xe9.jpg";
  std::string body = encode_show_json(p);
  TEST_ASSERT_TRUE(body.find("/gallerys/default/Caf\xef\xbf\xbd.jpg") != std::string::npos);
}

static void test_show_single_uses_full_path(void) {
  ShowParams p;
  p.gallery = "travel";
  p.filename = "a.jpg";
  p.dither = 1;
  TEST_ASSERT_EQUAL_STRING("{\"dither\":1,\"image\":\"/gallerys/travel/a.jpg\",\"play_type\":0}",
                           encode_show_json(p).c_str());
}

static void test_show_slideshow_names_gallery(void) {
  ShowParams p;
  p.gallery = "travel";
  p.filename = "a.jpg";
  p.play_type = PlayType::Slideshow;
  p.duration = 300;
  TEST_ASSERT_EQUAL_STRING("{\"duration\":300,\"gallery\":\"travel\",\"image\":\"a.jpg\",\"play_type\":1}",
                           encode_show_json(p).c_str());
}

static void test_gallery_listing_query(void) {
  Operation op = make_operation(OperationKind::ListGalleryImages);
  op.gallery = "my pics";
  op.offset = 20;
  op.limit = 10;
  HttpRequest r = build_device_request(op);
  TEST_ASSERT_EQUAL_STRING("/gallery?gallery_name=my%20pics&offset=20&limit=10", r.target.c_str());
}

static void test_upload_requests(void) {
  Operation op = make_operation(OperationKind::UploadToGallery);
  op.gallery = "default";
  op.filename = "ink_0123456789abcdef.jpg";
  op.image = {0xFF, 0xD8, 0xFF, 0xD9};
  HttpRequest r = build_device_request(op);
  TEST_ASSERT_EQUAL_STRING("POST", r.method.c_str());
  TEST_ASSERT_EQUAL_STRING("/upload?filename=ink_0123456789abcdef.jpg&gallery=default&show_now=0", r.target.c_str());
  TEST_ASSERT_EQUAL_INT(0, r.content_type.compare(0, 30, "multipart/form-data; boundary="));
  TEST_ASSERT_TRUE(r.body.size() > op.image.size());

  op.kind = OperationKind::PushImage;
  op.gallery.clear();
  r = build_device_request(op);
  TEST_ASSERT_EQUAL_STRING("/upload?filename=ink_0123456789abcdef.jpg&gallery=default&show_now=1", r.target.c_str());
}

static void test_device_info_decoding(void) {
  DeviceStatus st;
  std::string err;
  const std::string body =
      "{\"name\":\"Canvas\",\"version\":\"1.2.3\",\"battery\":\"76\",\"fs_free\":1048576,"
      "\"fs_total\":4194304,\"image\":\"/gallerys/default/a.jpg\",\"sleep_duration\":3600,"
      "\"max_idle\":120,\"idx_wake_sens\":3,\"width\":1200,\"height\":1600}";
  TEST_ASSERT_TRUE(parse_device_info(body, st, err));
  TEST_ASSERT_EQUAL_STRING("Canvas", st.name.c_str());
  TEST_ASSERT_EQUAL_STRING("1.2.3", st.version.c_str());
  TEST_ASSERT_EQUAL_INT(76, st.battery_percent);
  TEST_ASSERT_EQUAL_INT64(1048576, st.storage_free_bytes);
  TEST_ASSERT_EQUAL_INT64(4194304, st.storage_total_bytes);
  TEST_ASSERT_EQUAL_STRING("/gallerys/default/a.jpg", st.current_image.c_str());
  TEST_ASSERT_EQUAL_INT(3600, st.sleep_duration_s);
  TEST_ASSERT_EQUAL_INT(120, st.max_idle_s);
  TEST_ASSERT_EQUAL_INT(3, st.wake_sensitivity);
  TEST_ASSERT_EQUAL_INT(1200, st.screen_width);
  TEST_ASSERT_EQUAL_INT(1600, st.screen_height);
  TEST_ASSERT_FALSE(st.galleries_known);
}

static void test_device_info_missing_fields_stay_unknown(void) {
  DeviceStatus st;
  std::string err;
  TEST_ASSERT_TRUE(parse_device_info("{\"name\":\"x\"}", st, err));
  TEST_ASSERT_EQUAL_INT(-1, st.battery_percent);
  TEST_ASSERT_EQUAL_INT64(-1, st.storage_free_bytes);
}

static void test_padded_json_is_accepted(void) {
  DeviceStatus st;
  std::string err;
  TEST_ASSERT_TRUE(parse_device_info("<html><body>{\"battery\":5}</body></html>", st, err));
  TEST_ASSERT_EQUAL_INT(5, st.battery_percent);
  TEST_ASSERT_FALSE(parse_device_info("<html>busy</html>", st, err));
  TEST_ASSERT_FALSE(err.empty());
  TEST_ASSERT_FALSE(parse_device_info("[1,2]", st, err));
}

static void test_gallery_list_shapes(void) {
  std::vector<GallerySummary> g;
  std::string err;
  TEST_ASSERT_TRUE(parse_gallery_list("[\"default\",\"travel\"]", g, err));
  TEST_ASSERT_EQUAL_UINT(2, g.size());
  TEST_ASSERT_EQUAL_STRING("travel", g[1].name.c_str());
  TEST_ASSERT_EQUAL_INT(-1, g[1].item_count);

  TEST_ASSERT_TRUE(parse_gallery_list("{\"data\":[{\"name\":\"default\",\"count\":4}]}", g, err));
  TEST_ASSERT_EQUAL_UINT(1, g.size());
  TEST_ASSERT_EQUAL_INT(4, g[0].item_count);

  TEST_ASSERT_FALSE(parse_gallery_list("{\"oops\":1}", g, err));
}

static void test_gallery_page(void) {
  GalleryPage page;
  std::string err;
  TEST_ASSERT_TRUE(parse_gallery_page(
      "{\"data\":[{\"name\":\"a.jpg\",\"size\":100,\"time\":1700000000},{\"size\":1},{\"name\":\"b.jpg\"}],"
      "\"total\":12,\"offset\":0,\"limit\":3}", page, err));
  TEST_ASSERT_EQUAL_UINT(2, page.images.size());
  TEST_ASSERT_EQUAL_STRING("a.jpg", page.images[0].name.c_str());
  TEST_ASSERT_EQUAL_INT64(100, page.images[0].size);
  TEST_ASSERT_EQUAL_INT64(1700000000, page.images[0].time);
  TEST_ASSERT_EQUAL_INT(12, page.total);
  TEST_ASSERT_EQUAL_INT(3, page.limit);

  TEST_ASSERT_TRUE(parse_gallery_page("{\"data\":[]}", page, err));
  TEST_ASSERT_EQUAL_INT(0, page.total);
}

static void test_upload_path(void) {
  TEST_ASSERT_EQUAL_STRING("/gallerys/default/a.jpg",
                           parse_upload_path("{\"status\":100,\"path\":\"/gallerys/default/\"}", "default", "a.jpg").c_str());
  TEST_ASSERT_EQUAL_STRING("/gallerys/x/a.jpg",
                           parse_upload_path("{\"path\":\"/gallerys/x\"}", "default", "a.jpg").c_str());
  TEST_ASSERT_EQUAL_STRING("/gallerys/travel/a.jpg", parse_upload_path("OK", "travel", "a.jpg").c_str());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_simple_endpoints);
  RUN_TEST(test_settings_body_has_only_given_fields);
  RUN_TEST(test_invalid_utf8_text_is_replaced);
  RUN_TEST(test_show_single_uses_full_path);
  RUN_TEST(test_show_slideshow_names_gallery);
  RUN_TEST(test_gallery_listing_query);
  RUN_TEST(test_upload_requests);
  RUN_TEST(test_device_info_decoding);
  RUN_TEST(test_device_info_missing_fields_stay_unknown);
  RUN_TEST(test_padded_json_is_accepted);
  RUN_TEST(test_gallery_list_shapes);
  RUN_TEST(test_gallery_page);
  RUN_TEST(test_upload_path);
  return UNITY_END();
}
