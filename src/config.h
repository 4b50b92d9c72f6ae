#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "device_session.h"
#include "gallery_sync.h"
#include "image_prep.h"

namespace inkshell {

struct Config {
  // device
  std::string host;
  int port = 80;

  // session
  long long timeout_ms = 10000;
  long long upload_timeout_ms = 30000;
  long long probe_timeout_ms = 3000;
  int wake_retries = 3;
  int retry_attempts = 3;
  long long retry_backoff_ms = 500;

  // defaults
  int sleep_duration = 3600;
  std::size_t max_photos = 50;
  std::string gallery = "default";
  std::size_t max_upload_bytes = 4 * 1024 * 1024;
  std::size_t gallery_capacity = 0;
  std::int64_t storage_reserve_bytes = 0;
  int jpeg_quality = 90;
  int panel_width = 1200;
  int panel_height = 1600;

  // shell
  long long poll_interval_ms = 0;
  std::string post_cmd;
  bool verbose = false;

  std::string config_path;   // file the values came from, empty when none

  SessionOptions session_options() const;
  SyncOptions sync_options() const;
  ImageTarget image_target() const;
};

// Two-level "section:\n  key: value" file. Missing sections keep their defaults.
bool load_config_file(const std::string& path, Config& cfg, std::string& error);

// Command-line flags on top of `cfg`. `--config` is honoured first, then the
// remaining flags override file values. `show_help` is set for -h/--help.
bool parse_command_line(int argc, const char* const* argv, Config& cfg, bool& show_help, std::string& error);

bool validate_config(const Config& cfg, std::string& error);

std::string usage_text(const char* prog);

} // namespace inkshell
