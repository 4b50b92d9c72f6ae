#include "log.h"

#include <iomanip>
#include <iostream>
#include <mutex>

#include <unistd.h>

namespace inkshell {

static bool g_stdout_is_tty = isatty(STDOUT_FILENO);
static bool g_stderr_is_tty = isatty(STDERR_FILENO);

static std::mutex g_log_mtx;
static std::deque<LogItem> g_log_q;
static std::atomic<bool> g_repl_active{false};
static std::atomic<bool> g_wake_pending{false};
static std::atomic<int> g_wake_fd{-1};

static const char* log_color(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Info:  return "\033[36m";  // cyan
    case LogLevel::Warn:  return "\033[33m";  // yellow
    case LogLevel::Error: return "\033[31m";  // red
    case LogLevel::Debug: return "\033[90m";  // dim gray
  }
  return "\033[0m";
}

const char* log_label(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Debug: return "DEBUG";
  }
  return "LOG";
}

static bool use_color_for(std::ostream& os) {
  return (&os == &std::cerr) ? g_stderr_is_tty : g_stdout_is_tty;
}

std::string format_log_line(LogLevel lvl, const std::string& text) {
  std::string content = text;
  if (content.empty() || content.front() != '[') {
    content = std::string("[") + log_label(lvl) + "] " + content;
  }
  std::ostringstream line;
  line << std::left << std::setw(5) << log_label(lvl) << " | " << content;
  return line.str();
}

void write_log_line(LogLevel lvl, const std::string& text, std::ostream& os) {
  if (text.empty()) return;
  const std::string line = format_log_line(lvl, text);
  if (use_color_for(os)) {
    os << log_color(lvl) << line << "\033[0m" << '\n';
  } else {
    os << line << '\n';
  }
}

void log_enqueue(LogLevel lvl, std::string msg) {
  if (!g_repl_active.load(std::memory_order_relaxed)) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::ostream& os = (lvl == LogLevel::Error) ? std::cerr : std::cout;
    write_log_line(lvl, msg, os);
    os.flush();
    return;
  }
  {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_q.push_back({lvl, std::move(msg)});
  }

  // Write exactly one wake byte while a wake is pending
  int fd = g_wake_fd.load(std::memory_order_relaxed);
  if (fd != -1) {
    bool expected = false;
    if (g_wake_pending.compare_exchange_strong(expected, true, std::memory_order_relaxed)) {
      char x = 0;
      (void)!write(fd, &x, 1);
    }
  }
}

void log_attach_repl(int wake_fd) {
  g_wake_fd.store(wake_fd, std::memory_order_relaxed);
  g_repl_active.store(true, std::memory_order_relaxed);
}

void log_detach_repl() {
  g_repl_active.store(false, std::memory_order_relaxed);
  g_wake_fd.store(-1, std::memory_order_relaxed);
  // flush whatever is still queued
  for (const auto& it : log_take_pending()) {
    std::ostream& os = (it.level == LogLevel::Error) ? std::cerr : std::cout;
    write_log_line(it.level, it.text, os);
    os.flush();
  }
}

bool log_repl_active() {
  return g_repl_active.load(std::memory_order_relaxed);
}

std::deque<LogItem> log_take_pending() {
  std::deque<LogItem> out;
  std::lock_guard<std::mutex> lk(g_log_mtx);
  out.swap(g_log_q);
  return out;
}

void log_clear_wake() {
  g_wake_pending.store(false, std::memory_order_relaxed);
}

} // namespace inkshell
