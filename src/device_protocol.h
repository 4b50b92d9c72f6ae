#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "http_wire.h"
#include "operation.h"

namespace inkshell {

struct GallerySummary {
  std::string name;
  int item_count = -1;   // -1 when not known
};

// Immutable snapshot of what the device last reported. -1 / empty = not reported.
struct DeviceStatus {
  std::string name;
  std::string version;
  int battery_percent = -1;
  std::int64_t storage_free_bytes = -1;
  std::int64_t storage_total_bytes = -1;
  std::string current_image;
  int sleep_duration_s = -1;
  int max_idle_s = -1;
  int wake_sensitivity = -1;
  int screen_width = 0;
  int screen_height = 0;
  std::vector<GallerySummary> galleries;
  bool galleries_known = false;
};

struct GalleryImage {
  std::string name;
  std::int64_t size = 0;
  std::int64_t time = 0;
};

struct GalleryPage {
  std::vector<GalleryImage> images;
  int total = 0;
  int offset = 0;
  int limit = 0;
};

// Endpoint mapping for every operation kind.
HttpRequest build_device_request(const Operation& op);

// Body encoders exposed for tests and logging.
std::string encode_settings_json(const DeviceSettings& s);
std::string encode_show_json(const ShowParams& p);

// Lenient decoders. The firmware labels JSON as text/html and sometimes pads it, so
// the outermost {...} or [...] slice is used when the full body does not parse.
bool parse_device_info(const std::string& body, DeviceStatus& out, std::string& error);
bool parse_gallery_list(const std::string& body, std::vector<GallerySummary>& out, std::string& error);
bool parse_gallery_page(const std::string& body, GalleryPage& out, std::string& error);

// Full device path of an uploaded file, from the upload acknowledgement.
std::string parse_upload_path(const std::string& body, const std::string& gallery, const std::string& filename);

std::string gallery_image_path(const std::string& gallery, const std::string& filename);
std::string describe_status(const DeviceStatus& s);

} // namespace inkshell
