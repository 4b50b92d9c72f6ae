#include "device_protocol.h"

#include <cstdlib>
#include <initializer_list>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>

namespace inkshell {

using json = nlohmann::json;

static std::string make_boundary() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream oss;
  oss << "----inkshell" << std::hex << rng();
  return oss.str();
}

// Text fields come from user input; invalid UTF-8 becomes U+FFFD instead of throwing.
static std::string dump_lenient(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static HttpRequest post_json(const std::string& target, const std::string& body) {
  HttpRequest req;
  req.method = "POST";
  req.target = target;
  req.content_type = "application/json";
  req.body.assign(body.begin(), body.end());
  return req;
}

static HttpRequest simple(const char* method, const std::string& target) {
  HttpRequest req;
  req.method = method;
  req.target = target;
  return req;
}

std::string gallery_image_path(const std::string& gallery, const std::string& filename) {
  return "/gallerys/" + gallery + "/" + filename;
}

std::string encode_settings_json(const DeviceSettings& s) {
  json j = json::object();
  if (s.name) j["name"] = *s.name;
  if (s.sleep_duration) j["sleep_duration"] = *s.sleep_duration;
  if (s.max_idle) j["max_idle"] = *s.max_idle;
  if (s.wake_sensitivity) j["idx_wake_sens"] = *s.wake_sensitivity;
  return dump_lenient(j);
}

std::string encode_show_json(const ShowParams& p) {
  json j;
  j["play_type"] = static_cast<int>(p.play_type);
  switch (p.play_type) {
    case PlayType::Single:
    case PlayType::Playlist:
      j["image"] = gallery_image_path(p.gallery, p.filename);
      break;
    case PlayType::Slideshow:
      j["image"] = p.filename;
      j["gallery"] = p.gallery;
      j["duration"] = p.duration;
      break;
  }
  if (p.dither) j["dither"] = *p.dither;
  return dump_lenient(j);
}

HttpRequest build_device_request(const Operation& op) {
  switch (op.kind) {
    case OperationKind::RefreshInfo:    return simple("GET", "/deviceInfo");
    case OperationKind::NextImage:      return simple("POST", "/showNext");
    case OperationKind::Sleep:          return simple("POST", "/sleep");
    case OperationKind::Reboot:         return simple("POST", "/reboot");
    case OperationKind::ClearScreen:    return simple("POST", "/clearScreen");
    case OperationKind::Wake:           return simple("GET", "/whistle");
    case OperationKind::ListGalleries:  return simple("GET", "/gallery/list");
    case OperationKind::UpdateSettings: return post_json("/settings", encode_settings_json(op.settings));
    case OperationKind::ShowImage:      return post_json("/show", encode_show_json(op.show));
    case OperationKind::ListGalleryImages:
      return simple("GET", "/gallery" + build_query({{"gallery_name", op.gallery},
                                                     {"offset", std::to_string(op.offset)},
                                                     {"limit", std::to_string(op.limit)}}));
    case OperationKind::PushImage:
    case OperationKind::UploadToGallery: {
      const bool show_now = (op.kind == OperationKind::PushImage);
      MultipartBody mp = build_multipart_file("image", op.filename, "image/jpeg", op.image, make_boundary());
      HttpRequest req;
      req.method = "POST";
      req.target = "/upload" + build_query({{"filename", op.filename},
                                            {"gallery", op.gallery.empty() ? std::string("default") : op.gallery},
                                            {"show_now", show_now ? "1" : "0"}});
      req.content_type = mp.content_type;
      req.body = std::move(mp.bytes);
      return req;
    }
  }
  return simple("GET", "/deviceInfo");
}

// ----------------------------
// Decoding
// ----------------------------
static bool parse_lenient(const std::string& body, char open, char close, json& out, std::string& error) {
  out = json::parse(body, nullptr, false);
  if (!out.is_discarded()) return true;

  auto first = body.find(open);
  auto last = body.rfind(close);
  if (first == std::string::npos || last == std::string::npos || last <= first) {
    error = "no JSON found in response";
    return false;
  }
  out = json::parse(body.substr(first, last - first + 1), nullptr, false);
  if (out.is_discarded()) {
    error = "invalid JSON in response";
    return false;
  }
  return true;
}

static bool json_number(const json& j, std::initializer_list<const char*> keys, long long& out) {
  for (const char* k : keys) {
    auto it = j.find(k);
    if (it == j.end()) continue;
    if (it->is_number_integer()) { out = it->get<long long>(); return true; }
    if (it->is_number_float()) { out = static_cast<long long>(it->get<double>()); return true; }
    if (it->is_string()) {
      const std::string s = it->get<std::string>();
      char* end = nullptr;
      long long v = std::strtoll(s.c_str(), &end, 10);
      if (end && end != s.c_str() && *end == '\0') { out = v; return true; }
    }
  }
  return false;
}

static bool json_string(const json& j, std::initializer_list<const char*> keys, std::string& out) {
  for (const char* k : keys) {
    auto it = j.find(k);
    if (it != j.end() && it->is_string()) {
      out = it->get<std::string>();
      return true;
    }
  }
  return false;
}

bool parse_device_info(const std::string& body, DeviceStatus& out, std::string& error) {
  json j;
  if (!parse_lenient(body, '{', '}', j, error)) return false;
  if (!j.is_object()) {
    error = "device info is not a JSON object";
    return false;
  }

  DeviceStatus s;
  long long v = 0;
  json_string(j, {"name", "device_name"}, s.name);
  json_string(j, {"version", "fw_version", "firmware"}, s.version);
  json_string(j, {"image", "current_image", "cur_image"}, s.current_image);
  if (json_number(j, {"battery", "battery_level", "bat"}, v)) s.battery_percent = static_cast<int>(v);
  if (json_number(j, {"fs_free", "free_space", "storage_free"}, v)) s.storage_free_bytes = v;
  if (json_number(j, {"fs_total", "total_space", "storage_total"}, v)) s.storage_total_bytes = v;
  if (json_number(j, {"sleep_duration"}, v)) s.sleep_duration_s = static_cast<int>(v);
  if (json_number(j, {"max_idle"}, v)) s.max_idle_s = static_cast<int>(v);
  if (json_number(j, {"idx_wake_sens", "wake_sensitivity"}, v)) s.wake_sensitivity = static_cast<int>(v);
  if (json_number(j, {"width", "screen_width", "screen_w"}, v)) s.screen_width = static_cast<int>(v);
  if (json_number(j, {"height", "screen_height", "screen_h"}, v)) s.screen_height = static_cast<int>(v);

  out = std::move(s);
  return true;
}

bool parse_gallery_list(const std::string& body, std::vector<GallerySummary>& out, std::string& error) {
  json j;
  if (!parse_lenient(body, '[', ']', j, error)) return false;
  // some firmware wraps the list: {"data":[...]}
  if (j.is_object() && j.contains("data")) {
    json inner = j["data"];
    j = std::move(inner);
  }
  if (!j.is_array()) {
    error = "gallery list is not a JSON array";
    return false;
  }
  out.clear();
  for (const auto& e : j) {
    GallerySummary g;
    if (e.is_string()) {
      g.name = e.get<std::string>();
    } else if (e.is_object()) {
      json_string(e, {"name"}, g.name);
      long long v = 0;
      if (json_number(e, {"count", "total"}, v)) g.item_count = static_cast<int>(v);
    }
    if (!g.name.empty()) out.push_back(std::move(g));
  }
  return true;
}

bool parse_gallery_page(const std::string& body, GalleryPage& out, std::string& error) {
  json j;
  if (!parse_lenient(body, '{', '}', j, error)) return false;
  if (!j.is_object()) {
    error = "gallery page is not a JSON object";
    return false;
  }
  GalleryPage page;
  auto data = j.find("data");
  if (data != j.end() && data->is_array()) {
    for (const auto& e : *data) {
      if (!e.is_object()) continue;
      GalleryImage img;
      if (!json_string(e, {"name"}, img.name) || img.name.empty()) continue;
      long long v = 0;
      if (json_number(e, {"size"}, v)) img.size = v;
      if (json_number(e, {"time"}, v)) img.time = v;
      page.images.push_back(std::move(img));
    }
  }
  long long v = 0;
  page.total = json_number(j, {"total"}, v) ? static_cast<int>(v) : static_cast<int>(page.images.size());
  if (json_number(j, {"offset"}, v)) page.offset = static_cast<int>(v);
  if (json_number(j, {"limit"}, v)) page.limit = static_cast<int>(v);
  out = std::move(page);
  return true;
}

std::string parse_upload_path(const std::string& body, const std::string& gallery, const std::string& filename) {
  json j = json::parse(body, nullptr, false);
  std::string base;
  if (!j.is_discarded() && j.is_object()) json_string(j, {"path"}, base);
  if (base.empty()) return gallery_image_path(gallery, filename);
  if (base.back() != '/') base.push_back('/');
  return base + filename;
}

std::string describe_status(const DeviceStatus& s) {
  auto num = [](long long v) { return v < 0 ? std::string("--") : std::to_string(v); };
  std::ostringstream oss;
  oss << "name=" << (s.name.empty() ? "--" : s.name)
      << " version=" << (s.version.empty() ? "--" : s.version)
      << " battery=" << num(s.battery_percent) << "%"
      << " storage_free=" << num(s.storage_free_bytes)
      << " storage_total=" << num(s.storage_total_bytes)
      << " image=" << (s.current_image.empty() ? "--" : s.current_image)
      << " sleep_duration=" << num(s.sleep_duration_s)
      << " max_idle=" << num(s.max_idle_s)
      << " screen=" << s.screen_width << "x" << s.screen_height;
  if (s.galleries_known) {
    oss << " galleries=[";
    for (size_t i = 0; i < s.galleries.size(); ++i) {
      if (i) oss << ", ";
      oss << s.galleries[i].name << ":" << num(s.galleries[i].item_count);
    }
    oss << "]";
  }
  return oss.str();
}

} // namespace inkshell
