#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "device_protocol.h"
#include "device_session.h"
#include "errors.h"
#include "image_prep.h"
#include "operation.h"
#include "status_cache.h"

namespace inkshell {

struct OperationOutcome {
  int http_status = 0;
  std::string body;
  std::string image_path;                 // PushImage, UploadToGallery
  std::optional<DeviceStatus> status;     // RefreshInfo
  std::vector<GallerySummary> galleries;  // ListGalleries
  GalleryPage page;                       // ListGalleryImages
};

struct FacadeOptions {
  ImageTarget image;
  ImagePreparer prepare = prepare_image;
  std::string default_gallery = "default";
};

// One call per device action. Retry behaviour follows each kind's retry policy and
// errors come back unmodified from the session.
class CommandFacade {
 public:
  CommandFacade(DeviceSession& session, StatusCache& cache, FacadeOptions opts = {});

  bool perform(const Operation& op, OperationOutcome& out, DeviceError& err,
               const CancelToken* cancel = nullptr);

  bool next_image(DeviceError& err);
  bool sleep(DeviceError& err);
  bool reboot(DeviceError& err);
  bool clear_screen(DeviceError& err);
  bool wake(DeviceError& err);
  bool update_settings(const DeviceSettings& settings, DeviceError& err);
  bool refresh_info(DeviceStatus& out, DeviceError& err);
  bool push_image(const std::vector<std::uint8_t>& bytes, const std::string& gallery,
                  std::string& device_path, DeviceError& err);
  bool show_image(const ShowParams& params, DeviceError& err);
  bool list_galleries(std::vector<GallerySummary>& out, DeviceError& err);
  bool list_gallery_images(const std::string& gallery, int offset, int limit,
                           GalleryPage& out, DeviceError& err);

  std::optional<DeviceStatus> get_status(std::chrono::milliseconds max_age) const;
  bool refresh_status(DeviceStatus& out, DeviceError& err, const CancelToken* cancel = nullptr);

  DeviceSession& session() { return session_; }

 private:
  bool simple(OperationKind kind, DeviceError& err);
  ImageTarget image_target() const;

  DeviceSession& session_;
  StatusCache& cache_;
  FacadeOptions opts_;
};

} // namespace inkshell
