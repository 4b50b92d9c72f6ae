#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace inkshell {

struct MediaMetadata {
  std::string title;
  std::string mime;
  std::uint64_t size = 0;
  std::int64_t mtime = 0;   // seconds since epoch, 0 when unknown
};

struct MediaItem {
  std::string source_id;
  std::vector<std::uint8_t> bytes;
  bool readable = true;
  std::string error;        // why the bytes could not be read
  MediaMetadata metadata;
};

// One pass over a source. Items are produced on demand.
class MediaCursor {
 public:
  virtual ~MediaCursor() = default;
  // false once the sequence is exhausted
  virtual bool next(MediaItem& out) = 0;
};

class MediaSource {
 public:
  virtual ~MediaSource() = default;
  // A fresh cursor from the beginning on every call.
  virtual std::unique_ptr<MediaCursor> open() = 0;
  virtual std::string describe() const = 0;
};

// Image files under a directory, recursively, in sorted path order. File contents are
// read only when the cursor reaches them.
class DirectoryMediaSource : public MediaSource {
 public:
  explicit DirectoryMediaSource(std::filesystem::path root);

  std::unique_ptr<MediaCursor> open() override;
  std::string describe() const override { return root_.string(); }

  // Listing problems from the last open(), empty when the walk was clean.
  const std::string& scan_error() const { return scan_error_; }

 private:
  std::filesystem::path root_;
  std::string scan_error_;
};

bool is_image_extension(const std::string& ext);
std::string mime_for_extension(const std::string& ext);

} // namespace inkshell
