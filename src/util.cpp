#include "util.h"

#include "log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <thread>

#include <sys/types.h>
#include <unistd.h>

namespace inkshell {

std::string trim_copy(std::string s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  if (begin >= end) return {};
  return std::string(begin, end);
}

std::string to_lower_ascii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::vector<std::string> tokenize(const std::string& s) {
  std::vector<std::string> out; std::string cur; bool q=false;
  for (size_t i=0;i<s.size();++i) {
    char c=s[i];
    if (c=='"') { q=!q; continue; }
    if (!q && std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

bool split_key_value_line(const std::string& line, std::string& key, std::string& value) {
  auto pos = line.find(':');
  if (pos == std::string::npos) return false;
  key = trim_copy(line.substr(0, pos));
  value = trim_copy(line.substr(pos + 1));
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.size() - 2);
  }
  return !key.empty();
}

bool parse_int_value(const std::string& raw, long long& out) {
  std::string s = trim_copy(raw);
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  out = v;
  return true;
}

bool parse_bool_value(const std::string& raw, bool& out) {
  std::string s = to_lower_ascii(trim_copy(raw));
  if (s == "true" || s == "yes" || s == "on" || s == "1") { out = true; return true; }
  if (s == "false" || s == "no" || s == "off" || s == "0") { out = false; return true; }
  return false;
}

std::string join_path(const std::string& d, const std::string& n) {
  char sep = '/';
  if (d.empty()) return n;
  if (d.back() == sep) return d + n;
  return d + sep + n;
}

std::string basename_from_path(const std::string& p) {
  size_t pos = p.find_last_of("/\\");
  return (pos == std::string::npos) ? p : p.substr(pos + 1);
}

std::string expand_user_path(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;
  const char* home = std::getenv("HOME");
  if (!home || !*home) return path;
  if (path.size() == 1) return std::string(home);
  if (path[1] == '/') {
    return std::string(home) + path.substr(1);
  }
  // We don't support ~otheruser; return original string.
  return path;
}

std::string get_cache_dir() {
  const char* h = std::getenv("HOME");
  if (h) return std::string(h) + "/.cache/inkshell";
  return ".";
}

std::string default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return {};
  return std::string(home) + "/.config/inkshell/config.yaml";
}

bool read_file_bytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "unable to open " + path + ": " + std::strerror(errno);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    error = "read failed for " + path;
    return false;
  }
  return true;
}

bool interruptible_sleep(std::chrono::milliseconds total, const CancelToken* cancel) {
  using namespace std::chrono;
  auto deadline = steady_clock::now() + total;
  while (!is_cancelled(cancel)) {
    auto now = steady_clock::now();
    if (now >= deadline) return true;
    auto chunk = std::min(milliseconds(100), duration_cast<milliseconds>(deadline - now));
    std::this_thread::sleep_for(chunk);
  }
  return false;
}

void run_post_cmd_args(const std::string& path, const std::vector<std::string>& args) {
  if (path.empty()) return;

  pid_t pid = fork();
  if (pid == 0) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execv(path.c_str(), argv.data());
    _exit(127);
  }
  if (pid < 0) {
    LOGW("post-cmd: fork failed: " << std::strerror(errno));
    return;
  }
  // parent: we don't wait (SIGCHLD is ignored)
}

} // namespace inkshell
