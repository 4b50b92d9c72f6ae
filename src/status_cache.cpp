#include "status_cache.h"

#include "log.h"

namespace inkshell {

StatusCache::StatusCache(NowFn now) : now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

std::optional<DeviceStatus> StatusCache::get(std::chrono::milliseconds max_age) const {
  std::shared_ptr<const DeviceStatus> snap;
  Clock::time_point at;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    snap = snap_;
    at = stored_at_;
  }
  if (!snap) return std::nullopt;
  if (now_() - at > max_age) return std::nullopt;
  return *snap;
}

std::shared_ptr<const DeviceStatus> StatusCache::latest() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return snap_;
}

std::optional<std::chrono::milliseconds> StatusCache::age() const {
  Clock::time_point at;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!snap_) return std::nullopt;
    at = stored_at_;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(now_() - at);
}

void StatusCache::store(DeviceStatus status) {
  auto snap = std::make_shared<const DeviceStatus>(std::move(status));
  const auto at = now_();
  std::lock_guard<std::mutex> lk(mtx_);
  snap_ = std::move(snap);
  stored_at_ = at;
}

bool StatusCache::refresh(DeviceSession& session, DeviceStatus& out, DeviceError& err,
                          const CancelToken* cancel) {
  DeviceSession::Slot slot = session.acquire();
  return refresh(slot, out, err, cancel);
}

bool StatusCache::refresh(DeviceSession::Slot& slot, DeviceStatus& out, DeviceError& err,
                          const CancelToken* cancel) {
  HttpResponse resp;
  if (!slot.perform(make_operation(OperationKind::RefreshInfo), resp, err, cancel)) return false;

  DeviceStatus st;
  std::string perr;
  if (!parse_device_info(resp.body, st, perr)) {
    err = make_error(ErrorKind::MalformedResponse, slot.address(), "device info: " + perr, resp.status);
    return false;
  }

  // gallery names and counts; a failure here keeps the previous gallery view
  HttpResponse gresp;
  DeviceError gerr;
  std::vector<GallerySummary> galleries;
  if (slot.perform(make_operation(OperationKind::ListGalleries), gresp, gerr, cancel) &&
      parse_gallery_list(gresp.body, galleries, perr)) {
    for (auto& g : galleries) {
      if (g.item_count >= 0) continue;
      Operation page_op = make_operation(OperationKind::ListGalleryImages);
      page_op.gallery = g.name;
      page_op.limit = 1;
      HttpResponse presp;
      DeviceError perr_dev;
      GalleryPage page;
      if (slot.perform(page_op, presp, perr_dev, cancel) && parse_gallery_page(presp.body, page, perr)) {
        g.item_count = page.total;
      }
    }
    st.galleries = std::move(galleries);
    st.galleries_known = true;
  } else {
    LOGW("[status] gallery list unavailable: " << (gerr.ok() ? perr : gerr.describe()));
    if (auto prev = latest()) {
      st.galleries = prev->galleries;
      st.galleries_known = prev->galleries_known;
    }
  }

  store(st);
  out = std::move(st);
  return true;
}

} // namespace inkshell
