#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace inkshell {

// Cooperative cancellation flag shared between a caller and long-running work.
using CancelToken = std::atomic<bool>;

inline bool is_cancelled(const CancelToken* token) {
  return token && token->load(std::memory_order_relaxed);
}

std::string trim_copy(std::string s);
std::string to_lower_ascii(std::string s);

// tiny tokenizer: splits on spaces, respects "quotes"
std::vector<std::string> tokenize(const std::string& s);

// "key: value" with optional surrounding quotes on the value
bool split_key_value_line(const std::string& line, std::string& key, std::string& value);

bool parse_int_value(const std::string& raw, long long& out);
bool parse_bool_value(const std::string& raw, bool& out);

// ----------------------------
// FS helpers
// ----------------------------
std::string join_path(const std::string& d, const std::string& n);
std::string basename_from_path(const std::string& p);
std::string expand_user_path(const std::string& path);
std::string get_cache_dir();
std::string default_config_path();
bool read_file_bytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& error);

// Sleeps in 100 ms slices; returns early (false) once `cancel` is raised.
bool interruptible_sleep(std::chrono::milliseconds total, const CancelToken* cancel);

// fork/exec `path args...` without waiting; SIGCHLD is expected to be ignored.
void run_post_cmd_args(const std::string& path, const std::vector<std::string>& args);

} // namespace inkshell
