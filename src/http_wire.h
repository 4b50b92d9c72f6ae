#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace inkshell {

struct HttpRequest {
  std::string method = "GET";
  std::string target = "/";          // path plus query
  std::string content_type;          // empty when there is no body
  std::vector<std::uint8_t> body;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;  // names lower-cased
  std::string body;

  const std::string* header(const std::string& lower_name) const;
  bool ok() const { return status >= 200 && status < 300; }
};

enum class ParseState { Complete, Incomplete, Malformed };

// Serialize a request with Host, Content-Length and "Connection: close".
std::vector<std::uint8_t> serialize_request(const HttpRequest& req, const std::string& host, int port);

// Parse what has been received so far. `eof` means the peer closed the connection,
// which completes a response without Content-Length.
ParseState parse_response(const std::string& raw, bool eof, HttpResponse& out, std::string& error);

std::string url_encode(const std::string& s);
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

// multipart/form-data with a single file field
struct MultipartBody {
  std::string content_type;   // includes the boundary
  std::vector<std::uint8_t> bytes;
};
MultipartBody build_multipart_file(const std::string& field,
                                   const std::string& filename,
                                   const std::string& mime,
                                   const std::vector<std::uint8_t>& data,
                                   const std::string& boundary);

} // namespace inkshell
