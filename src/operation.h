#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inkshell {

enum class OperationKind {
  NextImage,
  Sleep,
  Reboot,
  ClearScreen,
  Wake,
  UpdateSettings,
  RefreshInfo,
  PushImage,
  UploadToGallery,
  ShowImage,
  ListGalleries,
  ListGalleryImages,
};

// Who may repeat an operation after a timeout.
enum class RetryPolicy {
  AutoRetry,    // the session repeats it on Timeout
  CallerRetry,  // surfaced to the caller, who decides
  Never,        // must not be repeated automatically by anyone
};

struct DeviceSettings {
  std::optional<std::string> name;
  std::optional<int> sleep_duration;   // seconds
  std::optional<int> max_idle;         // seconds
  std::optional<int> wake_sensitivity; // idx_wake_sens

  bool empty() const {
    return !name && !sleep_duration && !max_idle && !wake_sensitivity;
  }
};

enum class PlayType { Single = 0, Slideshow = 1, Playlist = 2 };

struct ShowParams {
  std::string gallery = "default";
  std::string filename;
  PlayType play_type = PlayType::Single;
  std::optional<int> dither;   // 0 = Floyd-Steinberg, 1 = JJN
  int duration = 99999;        // seconds per image in slideshow mode
};

struct Operation {
  OperationKind kind = OperationKind::RefreshInfo;
  DeviceSettings settings;          // UpdateSettings
  ShowParams show;                  // ShowImage
  std::string gallery;              // PushImage, UploadToGallery, ListGalleryImages
  std::string filename;             // PushImage, UploadToGallery
  std::vector<std::uint8_t> image;  // PushImage, UploadToGallery
  int offset = 0;                   // ListGalleryImages
  int limit = 100;                  // ListGalleryImages

  std::size_t payload_size() const { return image.size(); }
};

const char* operation_name(OperationKind kind);
bool parse_operation_kind(const std::string& name, OperationKind& out);
bool is_idempotent(OperationKind kind);
RetryPolicy retry_policy(OperationKind kind);
bool is_upload(OperationKind kind);
const char* play_type_name(PlayType t);
bool parse_play_type(const std::string& name, PlayType& out);

Operation make_operation(OperationKind kind);

} // namespace inkshell
