#include "gallery_sync.h"

#include <sstream>
#include <unordered_set>

#include "device_protocol.h"
#include "fingerprint.h"
#include "log.h"

namespace inkshell {

const char* sync_outcome_name(SyncOutcome o) {
  switch (o) {
    case SyncOutcome::Uploaded:         return "uploaded";
    case SyncOutcome::Overwritten:      return "overwritten";
    case SyncOutcome::SkippedDuplicate: return "skipped";
    case SyncOutcome::Failed:           return "failed";
  }
  return "failed";
}

std::string SyncResult::summary() const {
  std::ostringstream oss;
  oss << "examined=" << examined << " uploaded=" << uploaded << " overwritten=" << overwritten
      << " skipped=" << skipped_duplicate << " failed=" << failed;
  if (cancelled) oss << " (cancelled)";
  if (aborted) oss << " (aborted: " << abort_error.describe() << ")";
  return oss.str();
}

GallerySyncEngine::GallerySyncEngine(DeviceSession& session, const StatusCache& cache, SyncOptions opts)
    : session_(session), cache_(cache), opts_(std::move(opts)) {
  if (opts_.list_page_size <= 0) opts_.list_page_size = 100;
  if (!opts_.prepare) opts_.prepare = prepare_image;
}

ErrorKind GallerySyncEngine::classify_upload_error(const DeviceError& e) {
  switch (e.kind) {
    case ErrorKind::OperationRejected:
      if (e.http_status == 413 || e.http_status == 507) return ErrorKind::QuotaExceeded;
      if (e.http_status == 415) return ErrorKind::FormatUnsupported;
      return ErrorKind::UploadRejected;
    case ErrorKind::PayloadTooLarge:
      return ErrorKind::UploadRejected;
    default:
      return e.kind;
  }
}

ImageTarget GallerySyncEngine::image_target() const {
  ImageTarget t = opts_.image;
  if (auto st = cache_.latest()) {
    if (st->screen_width > 0 && st->screen_height > 0) {
      t.width = st->screen_width;
      t.height = st->screen_height;
    }
  }
  return t;
}

bool GallerySyncEngine::list_existing(DeviceSession::Slot& slot, const std::string& gallery,
                                      std::unordered_map<std::string, std::string>& by_fingerprint,
                                      std::size_t& item_count, DeviceError& err,
                                      const CancelToken* cancel) {
  by_fingerprint.clear();
  item_count = 0;
  int offset = 0;
  for (;;) {
    Operation op = make_operation(OperationKind::ListGalleryImages);
    op.gallery = gallery;
    op.offset = offset;
    op.limit = opts_.list_page_size;

    HttpResponse resp;
    if (!slot.perform(op, resp, err, cancel)) {
      // a gallery the device does not know yet is empty; the first upload creates it
      if (offset == 0 && err.kind == ErrorKind::OperationRejected &&
          err.http_status >= 400 && err.http_status < 500) {
        if (opts_.verbose) {
          LOGI("[sync] gallery '" << gallery << "' not listed (HTTP " << err.http_status << "), treating as empty");
        }
        err = DeviceError{};
        return true;
      }
      return false;
    }
    GalleryPage page;
    std::string perr;
    if (!parse_gallery_page(resp.body, page, perr)) {
      err = make_error(ErrorKind::MalformedResponse, slot.address(), "gallery listing: " + perr, resp.status);
      return false;
    }
    for (const auto& img : page.images) {
      ++item_count;
      std::string fp;
      if (fingerprint_from_filename(img.name, fp)) by_fingerprint.emplace(fp, img.name);
    }
    offset += static_cast<int>(page.images.size());
    if (page.images.empty() || offset >= page.total) return true;
  }
}

SyncResult GallerySyncEngine::sync(const SyncRequest& req, const CancelToken* cancel,
                                   const ItemObserver& observer) {
  SyncResult result;
  if (!req.source) {
    result.aborted = true;
    result.abort_error = make_error(ErrorKind::OperationRejected, session_.address(), "no media source");
    return result;
  }
  const std::string gallery = req.gallery.empty() ? std::string("default") : req.gallery;

  DeviceSession::Slot slot = session_.acquire();

  // fingerprints on the device, fetched fresh for every run
  std::unordered_map<std::string, std::string> existing;
  std::size_t gallery_items = 0;
  DeviceError lerr;
  if (!list_existing(slot, gallery, existing, gallery_items, lerr, cancel)) {
    if (lerr.kind == ErrorKind::Cancelled) {
      result.cancelled = true;
    } else {
      result.aborted = true;
      result.abort_error = lerr;
      LOGE("[sync] cannot enumerate gallery '" << gallery << "': " << lerr.describe());
    }
    return result;
  }
  if (opts_.verbose) {
    LOGI("[sync] gallery '" << gallery << "' holds " << gallery_items << " item(s), "
         << existing.size() << " with fingerprints");
  }

  // byte budget from the freshest known storage figure
  std::int64_t budget = -1;
  if (auto st = cache_.latest()) {
    if (st->storage_free_bytes >= 0) budget = st->storage_free_bytes - opts_.storage_reserve_bytes;
  }
  const ImageTarget target = image_target();

  auto fail = [&](SyncItemReport& rep, ErrorKind kind, std::string detail) {
    rep.outcome = SyncOutcome::Failed;
    rep.error = kind;
    rep.detail = detail;
    ++result.failed;
    result.failures.push_back({rep.source_id, kind, std::move(detail)});
    LOGW("[sync] " << rep.source_id << ": " << error_to_name(kind) << " " << rep.detail);
  };

  std::unordered_set<std::string> written;
  std::unique_ptr<MediaCursor> cursor = req.source->open();
  MediaItem item;
  while (result.uploaded + result.overwritten < req.max_photos) {
    if (is_cancelled(cancel)) {
      result.cancelled = true;
      break;
    }
    if (!cursor || !cursor->next(item)) break;
    ++result.examined;

    SyncItemReport rep;
    rep.source_id = item.source_id;

    if (!item.readable) {
      fail(rep, ErrorKind::SourceUnreadable, item.error);
      if (observer) observer(rep);
      continue;
    }

    rep.fingerprint = content_fingerprint(item.bytes);
    if (rep.fingerprint.empty()) {
      fail(rep, ErrorKind::SourceUnreadable, "fingerprint failed");
      if (observer) observer(rep);
      continue;
    }

    auto found = existing.find(rep.fingerprint);
    const bool replacing = (found != existing.end());
    // a second copy of something written in this run is a duplicate even when overwriting
    const bool written_now = written.count(rep.fingerprint) > 0;
    if (replacing && (!req.overwrite_existing || written_now)) {
      rep.outcome = SyncOutcome::SkippedDuplicate;
      rep.device_path = gallery_image_path(gallery, found->second);
      ++result.skipped_duplicate;
      if (opts_.verbose) LOGI("[sync] skip " << item.source_id << " (already on device as " << found->second << ")");
      if (observer) observer(rep);
      continue;
    }

    PreparedImage prepared;
    ErrorKind pkind = ErrorKind::None;
    std::string pdetail;
    if (!opts_.prepare(item.bytes, target, prepared, pkind, pdetail)) {
      fail(rep, pkind, pdetail);
      if (observer) observer(rep);
      continue;
    }

    const std::int64_t size = static_cast<std::int64_t>(prepared.jpeg.size());
    if (budget >= 0 && size > budget) {
      fail(rep, ErrorKind::QuotaExceeded,
           std::to_string(size) + " bytes needed, " + std::to_string(budget) + " available");
      if (observer) observer(rep);
      continue;
    }
    if (!replacing && opts_.gallery_capacity > 0 && gallery_items >= opts_.gallery_capacity) {
      fail(rep, ErrorKind::QuotaExceeded,
           "gallery holds " + std::to_string(gallery_items) + " of " + std::to_string(opts_.gallery_capacity) + " items");
      if (observer) observer(rep);
      continue;
    }

    Operation op = make_operation(OperationKind::UploadToGallery);
    op.gallery = gallery;
    op.filename = replacing ? found->second : fingerprint_filename(rep.fingerprint);
    op.image = std::move(prepared.jpeg);

    HttpResponse resp;
    DeviceError uerr;
    if (!slot.perform(op, resp, uerr, cancel)) {
      if (uerr.kind == ErrorKind::Cancelled) {
        // never sent; not counted as examined work
        --result.examined;
        result.cancelled = true;
        break;
      }
      fail(rep, classify_upload_error(uerr), uerr.describe());
      if (observer) observer(rep);
      continue;
    }

    rep.device_path = parse_upload_path(resp.body, gallery, op.filename);
    result.uploaded_paths.push_back(rep.device_path);
    if (budget >= 0) budget -= size;
    written.insert(rep.fingerprint);
    if (replacing) {
      rep.outcome = SyncOutcome::Overwritten;
      ++result.overwritten;
    } else {
      rep.outcome = SyncOutcome::Uploaded;
      ++result.uploaded;
      ++gallery_items;
      existing.emplace(rep.fingerprint, op.filename);
    }
    if (opts_.verbose) LOGI("[sync] " << sync_outcome_name(rep.outcome) << " " << item.source_id << " -> " << rep.device_path);
    if (observer) observer(rep);
  }

  return result;
}

} // namespace inkshell
