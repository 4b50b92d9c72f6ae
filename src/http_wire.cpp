#include "http_wire.h"

#include <cstdlib>
#include <sstream>

#include "util.h"

namespace inkshell {

const std::string* HttpResponse::header(const std::string& lower_name) const {
  for (const auto& h : headers) {
    if (h.first == lower_name) return &h.second;
  }
  return nullptr;
}

std::vector<std::uint8_t> serialize_request(const HttpRequest& req, const std::string& host, int port) {
  std::ostringstream head;
  head << req.method << ' ' << (req.target.empty() ? "/" : req.target) << " HTTP/1.1\r\n";
  head << "Host: " << host;
  if (port != 80) head << ':' << port;
  head << "\r\n";
  head << "User-Agent: inkshell\r\n";
  head << "Accept: */*\r\n";
  head << "Connection: close\r\n";
  if (!req.content_type.empty()) head << "Content-Type: " << req.content_type << "\r\n";
  if (!req.body.empty() || req.method == "POST" || req.method == "PUT") {
    head << "Content-Length: " << req.body.size() << "\r\n";
  }
  head << "\r\n";

  const std::string h = head.str();
  std::vector<std::uint8_t> out(h.begin(), h.end());
  out.insert(out.end(), req.body.begin(), req.body.end());
  return out;
}

static bool parse_hex_size(const std::string& s, size_t& out) {
  std::string t = trim_copy(s);
  auto semi = t.find(';');
  if (semi != std::string::npos) t = trim_copy(t.substr(0, semi));
  if (t.empty()) return false;
  char* end = nullptr;
  unsigned long long v = std::strtoull(t.c_str(), &end, 16);
  if (!end || *end != '\0') return false;
  out = static_cast<size_t>(v);
  return true;
}

// Returns Complete once the terminating zero chunk has been seen.
static ParseState decode_chunked(const std::string& raw, size_t pos, std::string& body, std::string& error) {
  body.clear();
  for (;;) {
    auto eol = raw.find("\r\n", pos);
    if (eol == std::string::npos) return ParseState::Incomplete;
    size_t len = 0;
    if (!parse_hex_size(raw.substr(pos, eol - pos), len)) {
      error = "bad chunk size";
      return ParseState::Malformed;
    }
    pos = eol + 2;
    if (len == 0) return ParseState::Complete;  // trailers are ignored
    if (raw.size() < pos + len + 2) return ParseState::Incomplete;
    body.append(raw, pos, len);
    pos += len;
    if (raw.compare(pos, 2, "\r\n") != 0) {
      error = "chunk not terminated by CRLF";
      return ParseState::Malformed;
    }
    pos += 2;
  }
}

ParseState parse_response(const std::string& raw, bool eof, HttpResponse& out, std::string& error) {
  auto head_end = raw.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    if (eof) {
      error = raw.empty() ? "empty response" : "truncated header";
      return ParseState::Malformed;
    }
    return ParseState::Incomplete;
  }

  out = HttpResponse{};
  std::istringstream head(raw.substr(0, head_end));
  std::string status_line;
  std::getline(head, status_line);
  if (!status_line.empty() && status_line.back() == '\r') status_line.pop_back();
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    error = "not an HTTP status line: " + status_line.substr(0, 40);
    return ParseState::Malformed;
  }
  auto sp1 = status_line.find(' ');
  if (sp1 == std::string::npos) {
    error = "status line without code";
    return ParseState::Malformed;
  }
  auto sp2 = status_line.find(' ', sp1 + 1);
  std::string code = status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
  long long status = 0;
  if (!parse_int_value(code, status) || status < 100 || status > 599) {
    error = "bad status code '" + code + "'";
    return ParseState::Malformed;
  }
  out.status = static_cast<int>(status);
  if (sp2 != std::string::npos) out.reason = status_line.substr(sp2 + 1);

  std::string line;
  while (std::getline(head, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      error = "header without colon";
      return ParseState::Malformed;
    }
    out.headers.emplace_back(to_lower_ascii(trim_copy(line.substr(0, colon))), trim_copy(line.substr(colon + 1)));
  }

  const size_t body_start = head_end + 4;
  const std::string* te = out.header("transfer-encoding");
  if (te && to_lower_ascii(*te).find("chunked") != std::string::npos) {
    ParseState st = decode_chunked(raw, body_start, out.body, error);
    if (st == ParseState::Incomplete && eof) {
      error = "truncated chunked body";
      return ParseState::Malformed;
    }
    return st;
  }

  if (const std::string* cl = out.header("content-length")) {
    long long len = 0;
    if (!parse_int_value(*cl, len) || len < 0) {
      error = "bad Content-Length '" + *cl + "'";
      return ParseState::Malformed;
    }
    const size_t need = body_start + static_cast<size_t>(len);
    if (raw.size() < need) {
      if (eof) {
        error = "body shorter than Content-Length";
        return ParseState::Malformed;
      }
      return ParseState::Incomplete;
    }
    out.body = raw.substr(body_start, static_cast<size_t>(len));
    return ParseState::Complete;
  }

  // No framing: the body runs until the peer closes.
  if (out.status == 204 || out.status == 304) return ParseState::Complete;
  if (!eof) return ParseState::Incomplete;
  out.body = raw.substr(body_start);
  return ParseState::Complete;
}

std::string url_encode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  for (const auto& p : params) {
    out.push_back(out.empty() ? '?' : '&');
    out += url_encode(p.first);
    out.push_back('=');
    out += url_encode(p.second);
  }
  return out;
}

MultipartBody build_multipart_file(const std::string& field,
                                   const std::string& filename,
                                   const std::string& mime,
                                   const std::vector<std::uint8_t>& data,
                                   const std::string& boundary) {
  MultipartBody mp;
  mp.content_type = "multipart/form-data; boundary=" + boundary;

  std::ostringstream pre;
  pre << "--" << boundary << "\r\n"
      << "Content-Disposition: form-data; name=\"" << field << "\"; filename=\"" << filename << "\"\r\n"
      << "Content-Type: " << mime << "\r\n\r\n";
  const std::string head = pre.str();
  const std::string tail = "\r\n--" + boundary + "--\r\n";

  mp.bytes.reserve(head.size() + data.size() + tail.size());
  mp.bytes.insert(mp.bytes.end(), head.begin(), head.end());
  mp.bytes.insert(mp.bytes.end(), data.begin(), data.end());
  mp.bytes.insert(mp.bytes.end(), tail.begin(), tail.end());
  return mp;
}

} // namespace inkshell
