#include "image_prep.h"

#include <algorithm>

#ifndef INKSHELL_HEADLESS
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#endif

namespace inkshell {

static constexpr int kMinJpegQuality = 40;
static constexpr int kQualityStep = 10;

bool looks_like_jpeg(const std::vector<std::uint8_t>& data) {
  return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

#ifdef INKSHELL_HEADLESS

// Without OpenCV only ready-made JPEGs can be sent.
bool prepare_image(const std::vector<std::uint8_t>& source, const ImageTarget& target,
                   PreparedImage& out, ErrorKind& kind, std::string& detail) {
  if (!looks_like_jpeg(source)) {
    kind = ErrorKind::FormatUnsupported;
    detail = "not a JPEG (headless build cannot convert images)";
    return false;
  }
  if (target.max_bytes > 0 && source.size() > target.max_bytes) {
    kind = ErrorKind::UploadRejected;
    detail = "JPEG of " + std::to_string(source.size()) + " bytes exceeds " + std::to_string(target.max_bytes);
    return false;
  }
  out = PreparedImage{};
  out.jpeg = source;
  return true;
}

#else

bool prepare_image(const std::vector<std::uint8_t>& source, const ImageTarget& target,
                   PreparedImage& out, ErrorKind& kind, std::string& detail) {
  if (source.empty()) {
    kind = ErrorKind::FormatUnsupported;
    detail = "empty image";
    return false;
  }
  const int panel_w = target.width > 0 ? target.width : 1200;
  const int panel_h = target.height > 0 ? target.height : 1600;

  try {
    cv::Mat raw(1, static_cast<int>(source.size()), CV_8UC1, const_cast<std::uint8_t*>(source.data()));
    cv::Mat img = cv::imdecode(raw, cv::IMREAD_COLOR);
    if (img.empty()) {
      kind = ErrorKind::FormatUnsupported;
      detail = "cannot decode image";
      return false;
    }

    const bool panel_portrait = panel_h > panel_w;
    const bool img_portrait = img.rows > img.cols;
    if (img.rows != img.cols && panel_w != panel_h && panel_portrait != img_portrait) {
      cv::rotate(img, img, cv::ROTATE_90_CLOCKWISE);
    }

    const double scale = std::min(static_cast<double>(panel_w) / img.cols,
                                  static_cast<double>(panel_h) / img.rows);
    const int fit_w = std::max(1, static_cast<int>(img.cols * scale + 0.5));
    const int fit_h = std::max(1, static_cast<int>(img.rows * scale + 0.5));
    cv::Mat fitted;
    cv::resize(img, fitted, cv::Size(std::min(fit_w, panel_w), std::min(fit_h, panel_h)), 0, 0,
               scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC);

    cv::Mat canvas(panel_h, panel_w, CV_8UC3, cv::Scalar(255, 255, 255));
    const int x = (panel_w - fitted.cols) / 2;
    const int y = (panel_h - fitted.rows) / 2;
    fitted.copyTo(canvas(cv::Rect(x, y, fitted.cols, fitted.rows)));

    std::vector<std::uint8_t> buf;
    for (int q = std::min(100, std::max(target.jpeg_quality, kMinJpegQuality)); q >= kMinJpegQuality; q -= kQualityStep) {
      buf.clear();
      if (!cv::imencode(".jpg", canvas, buf, {cv::IMWRITE_JPEG_QUALITY, q})) {
        kind = ErrorKind::FormatUnsupported;
        detail = "JPEG encode failed";
        return false;
      }
      if (target.max_bytes == 0 || buf.size() <= target.max_bytes) {
        out = PreparedImage{};
        out.jpeg = std::move(buf);
        out.width = panel_w;
        out.height = panel_h;
        out.quality = q;
        return true;
      }
    }
    kind = ErrorKind::UploadRejected;
    detail = "image does not fit " + std::to_string(target.max_bytes) + " bytes even at quality " +
             std::to_string(kMinJpegQuality);
    return false;
  } catch (const cv::Exception& e) {
    kind = ErrorKind::FormatUnsupported;
    detail = std::string("opencv: ") + e.what();
    return false;
  }
}

#endif

} // namespace inkshell
