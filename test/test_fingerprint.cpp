#include <unity.h>

#include <string>
#include <vector>

#include "fingerprint.h"

using namespace inkshell;

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

static std::vector<std::uint8_t> bytes_of(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

static void test_sha256_known_vectors(void) {
  const std::string abc = "abc";
  TEST_ASSERT_EQUAL_STRING("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                           sha256_hex(reinterpret_cast<const std::uint8_t*>(abc.data()), abc.size()).c_str());
  TEST_ASSERT_EQUAL_STRING("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                           sha256_hex(nullptr, 0).c_str());
}

static void test_fingerprint_is_sixteen_hex_digits(void) {
  TEST_ASSERT_EQUAL_STRING("ba7816bf8f01cfea", content_fingerprint(bytes_of("abc")).c_str());
}

static void test_fingerprint_depends_only_on_content(void) {
  TEST_ASSERT_EQUAL_STRING(content_fingerprint(bytes_of("photo")).c_str(),
                           content_fingerprint(bytes_of("photo")).c_str());
  TEST_ASSERT_TRUE(content_fingerprint(bytes_of("photo")) != content_fingerprint(bytes_of("photo2")));
}

static void test_filename_round_trip(void) {
  const std::string name = fingerprint_filename("ba7816bf8f01cfea");
  TEST_ASSERT_EQUAL_STRING("ink_ba7816bf8f01cfea.jpg", name.c_str());
  std::string fp;
  TEST_ASSERT_TRUE(fingerprint_from_filename(name, fp));
  TEST_ASSERT_EQUAL_STRING("ba7816bf8f01cfea", fp.c_str());
  TEST_ASSERT_TRUE(fingerprint_from_filename("INK_BA7816BF8F01CFEA.JPG", fp));
  TEST_ASSERT_EQUAL_STRING("ba7816bf8f01cfea", fp.c_str());
}

static void test_foreign_names_have_no_fingerprint(void) {
  std::string fp = "unchanged";
  TEST_ASSERT_FALSE(fingerprint_from_filename("holiday.jpg", fp));
  TEST_ASSERT_FALSE(fingerprint_from_filename("ink_ba7816bf8f01cfe.jpg", fp));
  TEST_ASSERT_FALSE(fingerprint_from_filename("ink_ba7816bf8f01cfeg.jpg", fp));
  TEST_ASSERT_FALSE(fingerprint_from_filename("ink_ba7816bf8f01cfea.png", fp));
  TEST_ASSERT_EQUAL_STRING("unchanged", fp.c_str());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_sha256_known_vectors);
  RUN_TEST(test_fingerprint_is_sixteen_hex_digits);
  RUN_TEST(test_fingerprint_depends_only_on_content);
  RUN_TEST(test_filename_round_trip);
  RUN_TEST(test_foreign_names_have_no_fingerprint);
  return UNITY_END();
}
