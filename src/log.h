#pragma once

#include <atomic>
#include <deque>
#include <sstream>
#include <string>

namespace inkshell {

// ----------------------------
// Logging
// ----------------------------
enum class LogLevel { Info, Warn, Error, Debug };

struct LogItem {
  LogLevel level;
  std::string text;
};

// Enqueue a message from any thread. Writes straight through when no REPL is attached.
void log_enqueue(LogLevel lvl, std::string msg);

// Render one line the way the shell prints it ("INFO  | [INFO] text", colored on a tty).
void write_log_line(LogLevel lvl, const std::string& text, std::ostream& os);
std::string format_log_line(LogLevel lvl, const std::string& text);
const char* log_label(LogLevel lvl);

// REPL integration: while active, messages are queued and one byte is written to the
// wake fd so the line editor can redraw after draining.
void log_attach_repl(int wake_fd);
void log_detach_repl();
bool log_repl_active();
std::deque<LogItem> log_take_pending();
// Called by the REPL after it consumed the wake byte.
void log_clear_wake();

} // namespace inkshell

// Stream-friendly macros: use like LOGI("foo " << x << " bar");
#define LOGI(expr) do { std::ostringstream _oss; _oss << expr; ::inkshell::log_enqueue(::inkshell::LogLevel::Info,  _oss.str()); } while(0)
#define LOGW(expr) do { std::ostringstream _oss; _oss << expr; ::inkshell::log_enqueue(::inkshell::LogLevel::Warn,  _oss.str()); } while(0)
#define LOGE(expr) do { std::ostringstream _oss; _oss << expr; ::inkshell::log_enqueue(::inkshell::LogLevel::Error, _oss.str()); } while(0)
#define LOGD(expr) do { std::ostringstream _oss; _oss << expr; ::inkshell::log_enqueue(::inkshell::LogLevel::Debug, _oss.str()); } while(0)
