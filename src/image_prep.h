#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "errors.h"

namespace inkshell {

struct ImageTarget {
  int width = 1200;                      // panel pixels
  int height = 1600;
  std::size_t max_bytes = 4 * 1024 * 1024;
  int jpeg_quality = 90;                 // first quality tried
};

struct PreparedImage {
  std::vector<std::uint8_t> jpeg;
  int width = 0;
  int height = 0;
  int quality = 0;
};

bool looks_like_jpeg(const std::vector<std::uint8_t>& data);

// Decode, rotate to the panel orientation, fit on a white canvas of the panel size and
// re-encode as JPEG, lowering quality until it fits `max_bytes`. On failure `kind` is
// FormatUnsupported (cannot decode) or UploadRejected (cannot fit).
bool prepare_image(const std::vector<std::uint8_t>& source, const ImageTarget& target,
                   PreparedImage& out, ErrorKind& kind, std::string& detail);

using ImagePreparer = std::function<bool(const std::vector<std::uint8_t>&, const ImageTarget&,
                                         PreparedImage&, ErrorKind&, std::string&)>;

} // namespace inkshell
