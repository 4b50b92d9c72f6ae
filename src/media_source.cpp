#include "media_source.h"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "util.h"

namespace fs = std::filesystem;

namespace inkshell {

bool is_image_extension(const std::string& ext) {
  static const char* kExts[] = {".jpg", ".jpeg", ".png", ".bmp", ".webp", ".gif", ".tif", ".tiff"};
  const std::string lower = to_lower_ascii(ext);
  return std::any_of(std::begin(kExts), std::end(kExts), [&](const char* e) { return lower == e; });
}

std::string mime_for_extension(const std::string& ext) {
  const std::string lower = to_lower_ascii(ext);
  if (lower == ".jpg" || lower == ".jpeg") return "image/jpeg";
  if (lower == ".png") return "image/png";
  if (lower == ".bmp") return "image/bmp";
  if (lower == ".webp") return "image/webp";
  if (lower == ".gif") return "image/gif";
  if (lower == ".tif" || lower == ".tiff") return "image/tiff";
  return "application/octet-stream";
}

namespace {

class DirectoryCursor : public MediaCursor {
 public:
  explicit DirectoryCursor(std::vector<fs::path> files) : files_(std::move(files)) {}

  bool next(MediaItem& out) override {
    if (pos_ >= files_.size()) return false;
    const fs::path& p = files_[pos_++];

    out = MediaItem{};
    out.source_id = p.string();
    out.metadata.title = p.filename().string();
    out.metadata.mime = mime_for_extension(p.extension().string());

    std::error_code ec;
    auto sz = fs::file_size(p, ec);
    if (!ec) out.metadata.size = static_cast<std::uint64_t>(sz);
    auto mt = fs::last_write_time(p, ec);
    if (!ec) {
      auto sys = std::chrono::time_point_cast<std::chrono::seconds>(
          mt - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
      out.metadata.mtime = sys.time_since_epoch().count();
    }

    std::string err;
    if (!read_file_bytes(out.source_id, out.bytes, err)) {
      out.readable = false;
      out.error = err;
      out.bytes.clear();
    }
    return true;
  }

 private:
  std::vector<fs::path> files_;
  std::size_t pos_ = 0;
};

} // namespace

DirectoryMediaSource::DirectoryMediaSource(fs::path root) : root_(std::move(root)) {}

std::unique_ptr<MediaCursor> DirectoryMediaSource::open() {
  scan_error_.clear();
  std::vector<fs::path> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    scan_error_ = root_.string() + ": " + ec.message();
    return std::make_unique<DirectoryCursor>(std::move(files));
  }
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      scan_error_ = ec.message();
      break;
    }
    std::error_code fec;
    if (!it->is_regular_file(fec) || fec) continue;
    const fs::path& p = it->path();
    const std::string name = p.filename().string();
    if (!name.empty() && name[0] == '.') continue;
    if (is_image_extension(p.extension().string())) files.push_back(p);
  }
  std::sort(files.begin(), files.end());
  return std::make_unique<DirectoryCursor>(std::move(files));
}

} // namespace inkshell
