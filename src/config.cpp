#include "config.h"

#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <unordered_map>

#include "util.h"

namespace inkshell {

SessionOptions Config::session_options() const {
  SessionOptions o;
  o.wake_retries = wake_retries;
  o.retry_attempts = retry_attempts;
  o.retry_backoff = std::chrono::milliseconds(retry_backoff_ms);
  o.timeout = std::chrono::milliseconds(timeout_ms);
  o.upload_timeout = std::chrono::milliseconds(upload_timeout_ms);
  o.probe_timeout = std::chrono::milliseconds(probe_timeout_ms);
  o.verbose = verbose;
  return o;
}

ImageTarget Config::image_target() const {
  ImageTarget t;
  t.width = panel_width;
  t.height = panel_height;
  t.max_bytes = max_upload_bytes;
  t.jpeg_quality = jpeg_quality;
  return t;
}

SyncOptions Config::sync_options() const {
  SyncOptions o;
  o.gallery_capacity = gallery_capacity;
  o.storage_reserve_bytes = storage_reserve_bytes;
  o.image = image_target();
  o.verbose = verbose;
  return o;
}

namespace {

using Setter = std::function<bool(Config&, const std::string&)>;

template <typename T>
Setter int_setter(T Config::*field, long long lo, long long hi) {
  return [field, lo, hi](Config& c, const std::string& v) {
    long long n = 0;
    if (!parse_int_value(v, n) || n < lo || n > hi) return false;
    c.*field = static_cast<T>(n);
    return true;
  };
}

Setter string_setter(std::string Config::*field) {
  return [field](Config& c, const std::string& v) {
    c.*field = v;
    return true;
  };
}

constexpr long long kMax = std::numeric_limits<int>::max();
constexpr long long kMaxBig = std::numeric_limits<long long>::max() / 2;

// section.key -> setter; the same names double as long command-line flags
const std::unordered_map<std::string, Setter>& config_keys() {
  static const std::unordered_map<std::string, Setter> keys = {
    {"device.host", string_setter(&Config::host)},
    {"device.port", int_setter(&Config::port, 1, 65535)},
    {"session.timeout_ms", int_setter(&Config::timeout_ms, 1, kMax)},
    {"session.upload_timeout_ms", int_setter(&Config::upload_timeout_ms, 1, kMax)},
    {"session.probe_timeout_ms", int_setter(&Config::probe_timeout_ms, 1, kMax)},
    {"session.wake_retries", int_setter(&Config::wake_retries, 1, 100)},
    {"session.retry_attempts", int_setter(&Config::retry_attempts, 1, 100)},
    {"session.retry_backoff_ms", int_setter(&Config::retry_backoff_ms, 0, kMax)},
    {"defaults.sleep_duration", int_setter(&Config::sleep_duration, 0, kMax)},
    {"defaults.max_photos", int_setter(&Config::max_photos, 0, kMax)},
    {"defaults.gallery", string_setter(&Config::gallery)},
    {"defaults.max_upload_bytes", int_setter(&Config::max_upload_bytes, 1024, kMaxBig)},
    {"defaults.gallery_capacity", int_setter(&Config::gallery_capacity, 0, kMax)},
    {"defaults.storage_reserve_bytes", int_setter(&Config::storage_reserve_bytes, 0, kMaxBig)},
    {"defaults.jpeg_quality", int_setter(&Config::jpeg_quality, 40, 100)},
    {"defaults.panel_width", int_setter(&Config::panel_width, 1, 10000)},
    {"defaults.panel_height", int_setter(&Config::panel_height, 1, 10000)},
    {"shell.poll_interval_ms", int_setter(&Config::poll_interval_ms, 0, kMax)},
    {"shell.post_cmd", [](Config& c, const std::string& v) { c.post_cmd = expand_user_path(v); return true; }},
    {"shell.verbose", [](Config& c, const std::string& v) { return parse_bool_value(v, c.verbose); }},
  };
  return keys;
}

} // namespace

bool load_config_file(const std::string& path, Config& cfg, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "config: unable to open " + path;
    return false;
  }

  const auto& keys = config_keys();
  std::string section;
  int line_no = 0;
  std::string raw_line;
  while (std::getline(in, raw_line)) {
    ++line_no;
    std::string line = raw_line;
    auto comment = line.find('#');
    if (comment != std::string::npos) line.erase(comment);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    int indent = 0;
    while (indent < static_cast<int>(line.size()) && line[indent] == ' ') ++indent;
    std::string content = trim_copy(line.substr(indent));
    if (content.empty()) continue;

    std::string key, value;
    if (!split_key_value_line(content, key, value)) {
      error = "config: expected 'key: value' on line " + std::to_string(line_no);
      return false;
    }

    if (indent == 0) {
      if (!value.empty()) {
        error = "config: top-level '" + key + "' must be a section (line " + std::to_string(line_no) + ")";
        return false;
      }
      if (key != "device" && key != "session" && key != "defaults" && key != "shell") {
        error = "config: unknown section '" + key + "' (line " + std::to_string(line_no) + ")";
        return false;
      }
      section = key;
      continue;
    }

    if (section.empty()) {
      error = "config: key '" + key + "' outside of a section (line " + std::to_string(line_no) + ")";
      return false;
    }
    if (indent < 2 || indent > 4) {
      error = "config: unsupported indentation on line " + std::to_string(line_no);
      return false;
    }

    auto it = keys.find(section + "." + key);
    if (it == keys.end()) {
      error = "config: unknown key '" + section + "." + key + "' (line " + std::to_string(line_no) + ")";
      return false;
    }
    if (!it->second(cfg, value)) {
      error = "config: invalid value '" + value + "' for " + section + "." + key + " (line " +
              std::to_string(line_no) + ")";
      return false;
    }
  }
  cfg.config_path = path;
  return true;
}

bool parse_command_line(int argc, const char* const* argv, Config& cfg, bool& show_help, std::string& error) {
  show_help = false;

  // flag -> config key
  static const std::unordered_map<std::string, std::string> kFlags = {
    {"--host", "device.host"},
    {"--port", "device.port"},
    {"--timeout", "session.timeout_ms"},
    {"--upload-timeout", "session.upload_timeout_ms"},
    {"--probe-timeout", "session.probe_timeout_ms"},
    {"--wake-retries", "session.wake_retries"},
    {"--retry-attempts", "session.retry_attempts"},
    {"--retry-backoff", "session.retry_backoff_ms"},
    {"--sleep-duration", "defaults.sleep_duration"},
    {"--max-photos", "defaults.max_photos"},
    {"--gallery", "defaults.gallery"},
    {"--max-upload-bytes", "defaults.max_upload_bytes"},
    {"--gallery-capacity", "defaults.gallery_capacity"},
    {"--keepalive", "shell.poll_interval_ms"},
    {"--cmd", "shell.post_cmd"},
  };

  // --config is applied before anything else so flags win over the file
  std::string config_path;
  bool explicit_config = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (i + 1 >= argc) {
        error = "--config needs a path";
        return false;
      }
      config_path = expand_user_path(argv[i + 1]);
      explicit_config = true;
    }
  }
  if (!explicit_config) {
    config_path = default_config_path();
    std::ifstream probe(config_path);
    if (!probe) config_path.clear();
  }
  if (!config_path.empty() && !load_config_file(config_path, cfg, error)) return false;

  const auto& keys = config_keys();
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      show_help = true;
      continue;
    }
    if (a == "--verbose" || a == "-v") {
      cfg.verbose = true;
      continue;
    }
    if (a == "--config") {
      ++i;
      continue;
    }
    auto f = kFlags.find(a);
    if (f == kFlags.end()) {
      error = "unknown option '" + a + "'";
      return false;
    }
    if (i + 1 >= argc) {
      error = a + " needs a value";
      return false;
    }
    std::string v = argv[++i];
    if (!keys.at(f->second)(cfg, v)) {
      error = "invalid value '" + v + "' for " + a;
      return false;
    }
  }
  return true;
}

bool validate_config(const Config& cfg, std::string& error) {
  if (trim_copy(cfg.host).empty()) {
    error = "no device host configured (use --host or device.host in the config file)";
    return false;
  }
  if (cfg.port < 1 || cfg.port > 65535) {
    error = "port out of range";
    return false;
  }
  if (cfg.wake_retries < 1 || cfg.retry_attempts < 1) {
    error = "wake_retries and retry_attempts must be at least 1";
    return false;
  }
  if (cfg.timeout_ms <= 0 || cfg.upload_timeout_ms <= 0 || cfg.probe_timeout_ms <= 0) {
    error = "timeouts must be positive";
    return false;
  }
  if (cfg.gallery.empty()) {
    error = "default gallery must not be empty";
    return false;
  }
  return true;
}

std::string usage_text(const char* prog) {
  std::ostringstream oss;
  oss << "Usage: " << (prog ? prog : "inkshell") << " --host <addr> [options]\n"
      << "  --config <path>          config file (default ~/.config/inkshell/config.yaml)\n"
      << "  --port <n>               device HTTP port (80)\n"
      << "  --timeout <ms>           command timeout (10000)\n"
      << "  --upload-timeout <ms>    upload timeout (30000)\n"
      << "  --probe-timeout <ms>     wake probe timeout (3000)\n"
      << "  --wake-retries <n>       wake probe attempts (3)\n"
      << "  --retry-attempts <n>     attempts for retryable commands (3)\n"
      << "  --retry-backoff <ms>     first retry delay, doubled per attempt (500)\n"
      << "  --sleep-duration <s>     default sleep duration for 'settings' (3600)\n"
      << "  --max-photos <n>         default sync limit (50)\n"
      << "  --gallery <name>         default gallery (default)\n"
      << "  --max-upload-bytes <n>   largest image sent to the device (4194304)\n"
      << "  --gallery-capacity <n>   item cap per gallery, 0 = none (0)\n"
      << "  --keepalive <ms>         background status refresh interval, 0 = off\n"
      << "  --cmd <exe>              run '<exe> <path> <gallery> <what>' after each upload\n"
      << "  -v, --verbose            verbose logging\n";
  return oss.str();
}

} // namespace inkshell
