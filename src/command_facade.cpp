#include "command_facade.h"

#include "fingerprint.h"

namespace inkshell {

CommandFacade::CommandFacade(DeviceSession& session, StatusCache& cache, FacadeOptions opts)
    : session_(session), cache_(cache), opts_(std::move(opts)) {
  if (!opts_.prepare) opts_.prepare = prepare_image;
  if (opts_.default_gallery.empty()) opts_.default_gallery = "default";
}

ImageTarget CommandFacade::image_target() const {
  ImageTarget t = opts_.image;
  if (auto st = cache_.latest()) {
    if (st->screen_width > 0 && st->screen_height > 0) {
      t.width = st->screen_width;
      t.height = st->screen_height;
    }
  }
  return t;
}

bool CommandFacade::perform(const Operation& op_in, OperationOutcome& out, DeviceError& err,
                            const CancelToken* cancel) {
  out = OperationOutcome{};
  Operation op = op_in;

  switch (op.kind) {
    case OperationKind::UpdateSettings:
      if (op.settings.empty()) {
        err = make_error(ErrorKind::OperationRejected, session_.address(), "no settings provided");
        return false;
      }
      break;
    case OperationKind::ShowImage:
      if (op.show.filename.empty()) {
        err = make_error(ErrorKind::OperationRejected, session_.address(), "no image given to show");
        return false;
      }
      if (op.show.gallery.empty()) op.show.gallery = opts_.default_gallery;
      break;
    case OperationKind::ListGalleryImages:
      if (op.gallery.empty()) op.gallery = opts_.default_gallery;
      break;
    case OperationKind::PushImage:
    case OperationKind::UploadToGallery: {
      if (op.gallery.empty()) op.gallery = opts_.default_gallery;
      PreparedImage prepared;
      ErrorKind kind = ErrorKind::None;
      std::string detail;
      if (!opts_.prepare(op.image, image_target(), prepared, kind, detail)) {
        err = make_error(kind, session_.address(), detail);
        return false;
      }
      if (op.filename.empty()) op.filename = fingerprint_filename(content_fingerprint(op.image));
      op.image = std::move(prepared.jpeg);
      break;
    }
    default:
      break;
  }

  HttpResponse resp;
  if (!session_.perform(op, resp, err, cancel)) return false;
  out.http_status = resp.status;

  std::string perr;
  switch (op.kind) {
    case OperationKind::RefreshInfo: {
      DeviceStatus st;
      if (!parse_device_info(resp.body, st, perr)) {
        err = make_error(ErrorKind::MalformedResponse, session_.address(), "device info: " + perr, resp.status);
        return false;
      }
      if (auto prev = cache_.latest()) {
        st.galleries = prev->galleries;
        st.galleries_known = prev->galleries_known;
      }
      out.status = std::move(st);
      break;
    }
    case OperationKind::ListGalleries:
      if (!parse_gallery_list(resp.body, out.galleries, perr)) {
        err = make_error(ErrorKind::MalformedResponse, session_.address(), "gallery list: " + perr, resp.status);
        return false;
      }
      break;
    case OperationKind::ListGalleryImages:
      if (!parse_gallery_page(resp.body, out.page, perr)) {
        err = make_error(ErrorKind::MalformedResponse, session_.address(), "gallery page: " + perr, resp.status);
        return false;
      }
      break;
    case OperationKind::PushImage:
    case OperationKind::UploadToGallery:
      out.image_path = parse_upload_path(resp.body, op.gallery, op.filename);
      break;
    default:
      break;
  }
  out.body = std::move(resp.body);
  return true;
}

bool CommandFacade::simple(OperationKind kind, DeviceError& err) {
  OperationOutcome out;
  return perform(make_operation(kind), out, err);
}

bool CommandFacade::next_image(DeviceError& err) { return simple(OperationKind::NextImage, err); }
bool CommandFacade::sleep(DeviceError& err) { return simple(OperationKind::Sleep, err); }
bool CommandFacade::reboot(DeviceError& err) { return simple(OperationKind::Reboot, err); }
bool CommandFacade::clear_screen(DeviceError& err) { return simple(OperationKind::ClearScreen, err); }
bool CommandFacade::wake(DeviceError& err) { return simple(OperationKind::Wake, err); }

bool CommandFacade::update_settings(const DeviceSettings& settings, DeviceError& err) {
  Operation op = make_operation(OperationKind::UpdateSettings);
  op.settings = settings;
  OperationOutcome out;
  return perform(op, out, err);
}

bool CommandFacade::refresh_info(DeviceStatus& status, DeviceError& err) {
  OperationOutcome out;
  if (!perform(make_operation(OperationKind::RefreshInfo), out, err)) return false;
  status = std::move(*out.status);
  return true;
}

bool CommandFacade::push_image(const std::vector<std::uint8_t>& bytes, const std::string& gallery,
                               std::string& device_path, DeviceError& err) {
  Operation op = make_operation(OperationKind::PushImage);
  op.gallery = gallery;
  op.image = bytes;
  OperationOutcome out;
  if (!perform(op, out, err)) return false;
  device_path = std::move(out.image_path);
  return true;
}

bool CommandFacade::show_image(const ShowParams& params, DeviceError& err) {
  Operation op = make_operation(OperationKind::ShowImage);
  op.show = params;
  OperationOutcome out;
  return perform(op, out, err);
}

bool CommandFacade::list_galleries(std::vector<GallerySummary>& galleries, DeviceError& err) {
  OperationOutcome out;
  if (!perform(make_operation(OperationKind::ListGalleries), out, err)) return false;
  galleries = std::move(out.galleries);
  return true;
}

bool CommandFacade::list_gallery_images(const std::string& gallery, int offset, int limit,
                                        GalleryPage& page, DeviceError& err) {
  Operation op = make_operation(OperationKind::ListGalleryImages);
  op.gallery = gallery;
  op.offset = offset < 0 ? 0 : offset;
  op.limit = limit <= 0 ? 100 : limit;
  OperationOutcome out;
  if (!perform(op, out, err)) return false;
  page = std::move(out.page);
  return true;
}

std::optional<DeviceStatus> CommandFacade::get_status(std::chrono::milliseconds max_age) const {
  return cache_.get(max_age);
}

bool CommandFacade::refresh_status(DeviceStatus& out, DeviceError& err, const CancelToken* cancel) {
  return cache_.refresh(session_, out, err, cancel);
}

} // namespace inkshell
