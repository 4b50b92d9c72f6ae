#include <unity.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

#include "config.h"

using namespace inkshell;

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

static std::string write_temp(const std::string& text) {
  char path[] = "/tmp/inkshell_cfg_XXXXXX";
  int fd = ::mkstemp(path);
  TEST_ASSERT_TRUE(fd >= 0);
  ::close(fd);
  std::ofstream out(path);
  out << text;
  return path;
}

static void test_defaults(void) {
  Config c;
  TEST_ASSERT_EQUAL_INT(80, c.port);
  TEST_ASSERT_EQUAL_INT(3, c.wake_retries);
  TEST_ASSERT_EQUAL_UINT(50, c.max_photos);
  TEST_ASSERT_EQUAL_STRING("default", c.gallery.c_str());
  SessionOptions o = c.session_options();
  TEST_ASSERT_EQUAL_INT64(10000, o.timeout.count());
  TEST_ASSERT_EQUAL_INT64(500, o.retry_backoff.count());
}

static void test_file_sections(void) {
  const std::string path = write_temp(
      "# canvas in the hallway\n"
      "device:\n"
      "  host: 192.168.1.40\n"
      "  port: 8080\n"
      "\n"
      "session:\n"
      "  wake_retries: 5   # slow to wake\n"
      "  retry_backoff_ms: 250\n"
      "defaults:\n"
      "  gallery: \"travel\"\n"
      "  max_photos: 12\n"
      "shell:\n"
      "  verbose: yes\n");
  Config c;
  std::string err;
  TEST_ASSERT_TRUE_MESSAGE(load_config_file(path, c, err), err.c_str());
  TEST_ASSERT_EQUAL_STRING("192.168.1.40", c.host.c_str());
  TEST_ASSERT_EQUAL_INT(8080, c.port);
  TEST_ASSERT_EQUAL_INT(5, c.wake_retries);
  TEST_ASSERT_EQUAL_INT64(250, c.retry_backoff_ms);
  TEST_ASSERT_EQUAL_STRING("travel", c.gallery.c_str());
  TEST_ASSERT_EQUAL_UINT(12, c.max_photos);
  TEST_ASSERT_TRUE(c.verbose);
  TEST_ASSERT_EQUAL_STRING(path.c_str(), c.config_path.c_str());
  std::remove(path.c_str());
}

static void test_file_errors_name_the_line(void) {
  const std::string path = write_temp("device:\n  host: a\n  colour: blue\n");
  Config c;
  std::string err;
  TEST_ASSERT_FALSE(load_config_file(path, c, err));
  TEST_ASSERT_TRUE(err.find("line 3") != std::string::npos);
  std::remove(path.c_str());

  const std::string bad = write_temp("session:\n  wake_retries: many\n");
  TEST_ASSERT_FALSE(load_config_file(bad, c, err));
  TEST_ASSERT_TRUE(err.find("session.wake_retries") != std::string::npos);
  std::remove(bad.c_str());

  TEST_ASSERT_FALSE(load_config_file("/nonexistent/inkshell.yaml", c, err));
}

static void test_flags_override_file(void) {
  const std::string path = write_temp("device:\n  host: 10.0.0.1\n  port: 81\n");
  const char* argv[] = {"inkshell", "--port", "82", "--config", path.c_str(), "--max-photos", "7", "-v"};
  Config c;
  bool help = false;
  std::string err;
  TEST_ASSERT_TRUE_MESSAGE(parse_command_line(8, argv, c, help, err), err.c_str());
  TEST_ASSERT_FALSE(help);
  TEST_ASSERT_EQUAL_STRING("10.0.0.1", c.host.c_str());
  TEST_ASSERT_EQUAL_INT(82, c.port);
  TEST_ASSERT_EQUAL_UINT(7, c.max_photos);
  TEST_ASSERT_TRUE(c.verbose);
  std::remove(path.c_str());
}

static void test_bad_flags(void) {
  const std::string path = write_temp("");
  Config c;
  bool help = false;
  std::string err;
  const char* unknown[] = {"inkshell", "--config", path.c_str(), "--colour", "x"};
  TEST_ASSERT_FALSE(parse_command_line(5, unknown, c, help, err));
  const char* missing[] = {"inkshell", "--config", path.c_str(), "--host"};
  TEST_ASSERT_FALSE(parse_command_line(4, missing, c, help, err));
  const char* range[] = {"inkshell", "--config", path.c_str(), "--port", "70000"};
  TEST_ASSERT_FALSE(parse_command_line(5, range, c, help, err));
  const char* helpme[] = {"inkshell", "--config", path.c_str(), "-h"};
  TEST_ASSERT_TRUE(parse_command_line(4, helpme, c, help, err));
  TEST_ASSERT_TRUE(help);
  std::remove(path.c_str());
}

static void test_validation(void) {
  Config c;
  std::string err;
  TEST_ASSERT_FALSE(validate_config(c, err));
  TEST_ASSERT_TRUE(err.find("host") != std::string::npos);
  c.host = "canvas.local";
  TEST_ASSERT_TRUE(validate_config(c, err));
  c.gallery.clear();
  TEST_ASSERT_FALSE(validate_config(c, err));
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_defaults);
  RUN_TEST(test_file_sections);
  RUN_TEST(test_file_errors_name_the_line);
  RUN_TEST(test_flags_override_file);
  RUN_TEST(test_bad_flags);
  RUN_TEST(test_validation);
  return UNITY_END();
}
