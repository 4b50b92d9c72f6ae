#include "operation.h"

#include <array>
#include <utility>

#include "util.h"

namespace inkshell {

namespace {

struct KindInfo {
  OperationKind kind;
  const char* name;
  bool idempotent;
  RetryPolicy policy;
};

// Idempotency table. Anything that changes what the panel shows, or restarts it, is
// never repeated behind the caller's back.
constexpr std::array<KindInfo, 12> kKinds = {{
  {OperationKind::NextImage,         "next_image",          false, RetryPolicy::CallerRetry},
  {OperationKind::Sleep,             "sleep",               false, RetryPolicy::CallerRetry},
  {OperationKind::Reboot,            "reboot",              false, RetryPolicy::Never},
  {OperationKind::ClearScreen,       "clear_screen",        false, RetryPolicy::CallerRetry},
  {OperationKind::Wake,              "wake",                true,  RetryPolicy::AutoRetry},
  {OperationKind::UpdateSettings,    "update_settings",     true,  RetryPolicy::AutoRetry},
  {OperationKind::RefreshInfo,       "refresh_info",        true,  RetryPolicy::AutoRetry},
  {OperationKind::PushImage,         "push_image",          false, RetryPolicy::CallerRetry},
  {OperationKind::UploadToGallery,   "upload_to_gallery",   false, RetryPolicy::Never},
  {OperationKind::ShowImage,         "show_image",          true,  RetryPolicy::AutoRetry},
  {OperationKind::ListGalleries,     "list_galleries",      true,  RetryPolicy::AutoRetry},
  {OperationKind::ListGalleryImages, "list_gallery_images", true,  RetryPolicy::AutoRetry},
}};

const KindInfo& info_for(OperationKind kind) {
  for (const auto& k : kKinds) {
    if (k.kind == kind) return k;
  }
  return kKinds[6];
}

} // namespace

const char* operation_name(OperationKind kind) { return info_for(kind).name; }

bool parse_operation_kind(const std::string& name, OperationKind& out) {
  const std::string lower = to_lower_ascii(trim_copy(name));
  for (const auto& k : kKinds) {
    if (lower == k.name) {
      out = k.kind;
      return true;
    }
  }
  return false;
}

bool is_idempotent(OperationKind kind) { return info_for(kind).idempotent; }

RetryPolicy retry_policy(OperationKind kind) { return info_for(kind).policy; }

bool is_upload(OperationKind kind) {
  return kind == OperationKind::PushImage || kind == OperationKind::UploadToGallery;
}

const char* play_type_name(PlayType t) {
  switch (t) {
    case PlayType::Single:    return "single";
    case PlayType::Slideshow: return "slideshow";
    case PlayType::Playlist:  return "playlist";
  }
  return "single";
}

bool parse_play_type(const std::string& name, PlayType& out) {
  const std::string lower = to_lower_ascii(trim_copy(name));
  if (lower == "single" || lower == "0") { out = PlayType::Single; return true; }
  if (lower == "slideshow" || lower == "1") { out = PlayType::Slideshow; return true; }
  if (lower == "playlist" || lower == "2") { out = PlayType::Playlist; return true; }
  return false;
}

Operation make_operation(OperationKind kind) {
  Operation op;
  op.kind = kind;
  return op;
}

} // namespace inkshell
