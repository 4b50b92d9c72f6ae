#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_session.h"
#include "errors.h"
#include "image_prep.h"
#include "media_source.h"
#include "status_cache.h"
#include "util.h"

namespace inkshell {

struct SyncRequest {
  MediaSource* source = nullptr;
  std::string gallery = "default";
  std::size_t max_photos = 50;          // successful uploads (new + overwritten)
  bool overwrite_existing = false;
};

enum class SyncOutcome { Uploaded, Overwritten, SkippedDuplicate, Failed };

const char* sync_outcome_name(SyncOutcome o);

struct SyncItemReport {
  std::string source_id;
  SyncOutcome outcome = SyncOutcome::Failed;
  std::string fingerprint;
  std::string device_path;   // set for uploads
  ErrorKind error = ErrorKind::None;
  std::string detail;
};

struct SyncFailure {
  std::string source_id;
  ErrorKind kind = ErrorKind::None;
  std::string detail;
};

struct SyncResult {
  std::size_t examined = 0;
  std::size_t uploaded = 0;
  std::size_t overwritten = 0;
  std::size_t skipped_duplicate = 0;
  std::size_t failed = 0;
  std::vector<SyncFailure> failures;
  std::vector<std::string> uploaded_paths;
  bool cancelled = false;
  bool aborted = false;        // gallery could not be enumerated; nothing examined
  DeviceError abort_error;

  bool success() const { return !aborted && !cancelled && failed == 0; }
  std::string summary() const;
};

struct SyncOptions {
  std::size_t gallery_capacity = 0;        // max items in the target gallery, 0 = unlimited
  std::int64_t storage_reserve_bytes = 0;  // keep this much device storage free
  ImageTarget image;                       // panel size used when the device did not report one
  int list_page_size = 100;
  bool verbose = false;
  ImagePreparer prepare = prepare_image;
};

// Reconciles a media source against one device gallery. Items are matched by content
// fingerprint; the session is held for the whole run.
class GallerySyncEngine {
 public:
  using ItemObserver = std::function<void(const SyncItemReport&)>;

  GallerySyncEngine(DeviceSession& session, const StatusCache& cache, SyncOptions opts);

  SyncResult sync(const SyncRequest& req, const CancelToken* cancel = nullptr,
                  const ItemObserver& observer = {});

  // Map upload failures onto sync-item kinds; transport and session kinds pass through.
  static ErrorKind classify_upload_error(const DeviceError& e);

 private:
  bool list_existing(DeviceSession::Slot& slot, const std::string& gallery,
                     std::unordered_map<std::string, std::string>& by_fingerprint,
                     std::size_t& item_count, DeviceError& err, const CancelToken* cancel);
  ImageTarget image_target() const;

  DeviceSession& session_;
  const StatusCache& cache_;
  SyncOptions opts_;
};

} // namespace inkshell
