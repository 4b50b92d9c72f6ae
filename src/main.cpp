#include <iostream>
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>
#include <cstring>
#include <cstdio>
#include <mutex>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <functional>
#include <deque>
#include <clocale>
#include <optional>
#include <cerrno>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <histedit.h>

#include "command_facade.h"
#include "config.h"
#include "device_protocol.h"
#include "device_session.h"
#include "errors.h"
#include "gallery_sync.h"
#include "log.h"
#include "media_source.h"
#include "status_cache.h"
#include "transport_client.h"
#include "util.h"

using namespace inkshell;

// ----------------------------
// Globals
// ----------------------------
static std::atomic<bool> g_stop{false};
static int g_wake_pipe[2] = {-1, -1};
static std::atomic<bool> g_sync_abort{false};
static std::atomic<bool> g_sync_running{false};
static std::thread g_sync_thread;
static std::thread g_poll_thread;
static CancelToken g_cmd_cancel{false};   // raised by Ctrl-C while a command runs
static std::atomic<bool> g_sigint_requested{false};
static std::atomic<bool> g_shutdown_requested{false};
static std::atomic<int>  g_sigint_count{0};
static DeviceSession* g_prompt_session = nullptr;

static inline void wake_repl_loop() {
  if (g_wake_pipe[1] != -1) {
    char x = 0;
    (void)!write(g_wake_pipe[1], &x, 1);
  }
}

static inline void request_shutdown() {
  g_stop.store(true, std::memory_order_release);
  g_sync_abort.store(true, std::memory_order_release);
  g_cmd_cancel.store(true, std::memory_order_release);
  wake_repl_loop();
}

// Drain everything that's queued and repaint the prompt.
// Call ONLY from the input thread that owns `el`.
static inline bool drain_logs_and_refresh(EditLine* el_or_null) {
  std::deque<LogItem> local = log_take_pending();
  if (local.empty()) return false;

  // clear current line once so the prompt vanishes while we print logs
  std::fputs("\r\033[K", stdout);

  for (auto& it : local) {
    std::ostream& os = (it.level == LogLevel::Error) ? std::cerr : std::cout;
    write_log_line(it.level, it.text, os);
  }
  std::cout.flush();
  std::cerr.flush();

  if (el_or_null) {
    el_set(el_or_null, EL_REFRESH, 0);
    std::fputs("\033[K", stdout); // prevents log output from slicing through a partially typed line
    std::fflush(stdout);
  }
  return true;
}

// poll()-based getchar so logs can wake the REPL
static int my_getc(EditLine* el, char* c) {
  if (!el || !c) return 0;

  struct pollfd fds[2];
  int nfds = 1;
  fds[0].fd = STDIN_FILENO;   fds[0].events = POLLIN; fds[0].revents = 0;
  fds[1].fd = -1;             fds[1].events = POLLIN; fds[1].revents = 0;
  if (g_wake_pipe[0] != -1) { fds[1].fd = g_wake_pipe[0]; nfds = 2; }

  for (;;) {
    if (g_sigint_requested.exchange(false, std::memory_order_relaxed)) {
      tcflush(STDIN_FILENO, TCIFLUSH);
      el_reset(el);
      *c = '\n';
      return 1;
    }

    int r = poll(fds, nfds, -1);
    if (r < 0) {
      if (errno == EINTR) {
        if (g_stop.load(std::memory_order_relaxed)) return 0; // make el_gets() exit
        continue;
      }
      return -1;
    }

    // Wake pipe: drain, repaint prompt, and continue waiting for real input
    if (nfds == 2 && (fds[1].revents & POLLIN)) {
      char buf[256];
      while (true) {
        ssize_t n = read(g_wake_pipe[0], buf, sizeof(buf));
        if (n <= 0) break;
      }
      log_clear_wake();

      (void)drain_logs_and_refresh(el);

      if (g_stop.load(std::memory_order_relaxed)) return 0;
      continue;
    }

    if (fds[0].revents & POLLIN) {
      ssize_t n = read(STDIN_FILENO, c, 1);
      if (n == 1) {
        if (*c == 4) { // Ctrl-D -> EOF
          g_stop.store(true, std::memory_order_relaxed);
          return 0;
        }
        if (*c == 3) { // Ctrl-C -> cancel current input line
          tcflush(STDIN_FILENO, TCIFLUSH);
          el_reset(el);
          *c = '\n';
          return 1;
        }
        return 1;
      }
      if (n == 0) {
        g_stop.store(true, std::memory_order_relaxed);
        return 0;
      }
      if (errno == EINTR) continue;
      return -1;
    }
  }
}

// ----------------------------
// Signals
// ----------------------------
static void signal_handler(int sig) {
  if (sig == SIGINT) {
    if (log_repl_active() && !g_shutdown_requested.load(std::memory_order_relaxed)) {
      g_sigint_requested.store(true, std::memory_order_relaxed);
      g_cmd_cancel.store(true, std::memory_order_relaxed);
      return;
    }
    int count = g_sigint_count.fetch_add(1, std::memory_order_relaxed) + 1;
    g_shutdown_requested.store(true, std::memory_order_release);
    request_shutdown();
    if (count >= 2) {
      _exit(130);
    }
    return;
  }
  g_shutdown_requested.store(true, std::memory_order_release);
  request_shutdown();
}

static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  // Avoid zombies from post-cmd children
  struct sigaction sa_chld{};
  sa_chld.sa_handler = SIG_IGN;
  sigemptyset(&sa_chld.sa_mask);
  sa_chld.sa_flags = 0;
  sigaction(SIGCHLD, &sa_chld, nullptr);
}

static void block_sigint_in_this_thread() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

static void unblock_sigint_in_this_thread() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}

// ----------------------------
// REPL helpers
// ----------------------------
static void log_command_overview() {
  LOGI("inkshell commands:");
  LOGI("  help                 Show this command overview");
  LOGI("  state                Connectivity state, last contact and last error");
  LOGI("  status [max_age_s]   Cached device status (default max age 60 s)");
  LOGI("  info | refresh       Fetch status and gallery counts from the device");
  LOGI("  next                 Show the next image");
  LOGI("  sleep                Put the device to sleep");
  LOGI("  reboot               Reboot the device");
  LOGI("  clear                Clear the screen");
  LOGI("  wake | whistle       Wake the device / keep it awake");
  LOGI("  settings k=v ...     name=, sleep_duration=, max_idle=, wake_sensitivity=");
  LOGI("                       (no arguments applies the configured sleep duration)");
  LOGI("  push <file> [gal]    Prepare, upload and display a local image");
  LOGI("  show <gal> <file> [single|slideshow|playlist] [duration] [dither]");
  LOGI("  galleries            List galleries");
  LOGI("  gallery <name> [offset] [limit]");
  LOGI("  sync <dir> [gal] [max] [overwrite]   Mirror a folder into a gallery");
  LOGI("  sync stop            Cancel the running sync after the current item");
  LOGI("  quit | exit          Leave inkshell");
  LOGI("Shortcuts:");
  LOGI("  Ctrl+C               Cancel the current line or the running command");
  LOGI("  Ctrl+D               Quit the shell (same as 'exit')");
}

static const std::vector<std::string> commands = {
  "help", "state", "status", "info", "refresh", "next", "sleep", "reboot", "clear", "wake",
  "whistle", "settings", "push", "show", "galleries", "gallery", "sync", "quit", "exit"
};

char* prompt(EditLine*) {
  static thread_local std::string text;
  text = "inkshell";
  if (g_prompt_session) {
    ConnectivityState s = g_prompt_session->state();
    if (s != ConnectivityState::Awake) text += std::string("[") + state_name(s) + "]";
  }
  text += "> ";
  return const_cast<char*>(text.c_str());
}

// completion callback
unsigned char complete(EditLine* el, int) {
  const LineInfo* li = el_line(el);
  std::string buf(li->buffer, li->lastchar - li->buffer);

  for (auto& cmd : commands) {
    if (cmd.rfind(buf, 0) == 0) {
      el_insertstr(el, cmd.c_str() + buf.size());
      return CC_REFRESH;
    }
  }
  return CC_REFRESH;
}

static int report(const char* tag, const DeviceError& err) {
  if (err.kind == ErrorKind::Cancelled) {
    LOGW(tag << ": cancelled");
  } else {
    LOGE(tag << ": " << err.describe());
  }
  return 2;
}

static bool parse_int_arg(const std::string& s, long long lo, long long hi, long long& out) {
  return parse_int_value(s, out) && out >= lo && out <= hi;
}

static bool parse_settings_args(const std::vector<std::string>& args, DeviceSettings& s, std::string& error) {
  for (size_t i = 1; i < args.size(); ++i) {
    auto eq = args[i].find('=');
    if (eq == std::string::npos) {
      error = "expected key=value, got '" + args[i] + "'";
      return false;
    }
    std::string key = to_lower_ascii(args[i].substr(0, eq));
    std::string value = args[i].substr(eq + 1);
    long long n = 0;
    if (key == "name") {
      s.name = value;
    } else if (key == "sleep_duration" || key == "max_idle" || key == "wake_sensitivity" || key == "idx_wake_sens") {
      if (!parse_int_arg(value, 0, 1LL << 30, n)) {
        error = "invalid number for " + key + ": '" + value + "'";
        return false;
      }
      if (key == "sleep_duration") s.sleep_duration = static_cast<int>(n);
      else if (key == "max_idle") s.max_idle = static_cast<int>(n);
      else s.wake_sensitivity = static_cast<int>(n);
    } else {
      error = "unknown setting '" + key + "'";
      return false;
    }
  }
  return true;
}

static void log_status(const DeviceStatus& st, std::optional<std::chrono::milliseconds> age) {
  std::ostringstream head;
  head << "Device status";
  if (age) head << " (" << age->count() / 1000 << " s old)";
  LOGI(head.str() << ":");
  LOGI("  name            " << (st.name.empty() ? "--" : st.name) << "  fw " << (st.version.empty() ? "--" : st.version));
  LOGI("  battery         " << (st.battery_percent < 0 ? std::string("--") : std::to_string(st.battery_percent) + "%"));
  LOGI("  storage         " << (st.storage_free_bytes < 0 ? std::string("--") : std::to_string(st.storage_free_bytes))
       << " free / " << (st.storage_total_bytes < 0 ? std::string("--") : std::to_string(st.storage_total_bytes)) << " bytes");
  LOGI("  screen          " << st.screen_width << "x" << st.screen_height);
  LOGI("  current image   " << (st.current_image.empty() ? "--" : st.current_image));
  LOGI("  sleep_duration  " << st.sleep_duration_s << " s, max_idle " << st.max_idle_s << " s, wake_sens " << st.wake_sensitivity);
  if (st.galleries_known) {
    for (const auto& g : st.galleries) {
      LOGI("  gallery         " << g.name << " (" << (g.item_count < 0 ? std::string("?") : std::to_string(g.item_count)) << ")");
    }
  }
}

// ----------------------------
// Background status poller
// ----------------------------
static void poll_loop(StatusCache& cache, DeviceSession& session, std::chrono::milliseconds interval, bool verbose) {
  ConnectivityState last_state = session.state();
  while (!g_stop.load(std::memory_order_relaxed)) {
    if (!interruptible_sleep(interval, &g_stop)) break;
    // a running sync owns the device; skip this round rather than queue behind it
    if (g_sync_running.load(std::memory_order_acquire)) continue;

    DeviceStatus st;
    DeviceError err;
    if (cache.refresh(session, st, err, &g_stop)) {
      if (verbose) LOGD("[poll] " << describe_status(st));
    } else if (err.kind != ErrorKind::Cancelled && (verbose || session.state() != last_state)) {
      LOGW("[poll] " << err.describe());
    }
    last_state = session.state();
  }
}

int main(int argc, char **argv) {
  std::setlocale(LC_CTYPE, "");

  install_signal_handlers();
  block_sigint_in_this_thread();

  Config cfg;
  bool show_help = false;
  std::string cfg_error;
  if (!parse_command_line(argc, argv, cfg, show_help, cfg_error)) {
    LOGE(cfg_error);
    std::cerr << usage_text(argv[0]);
    return 1;
  }
  if (show_help) {
    std::cout << usage_text(argv[0]);
    return 0;
  }
  if (!validate_config(cfg, cfg_error)) {
    LOGE(cfg_error);
    return 1;
  }
  const bool verbose = cfg.verbose;
  if (verbose && !cfg.config_path.empty()) LOGI("Loaded config " << cfg.config_path);

#ifdef INKSHELL_HEADLESS
  LOGW("Image conversion disabled: inkshell built with -DINKSHELL_HEADLESS=ON (OpenCV omitted); only JPEG input is accepted");
#endif

  HttpTransport transport(cfg.host, cfg.port, cfg.max_upload_bytes, verbose);
  StatusCache cache;
  DeviceSession session(transport, cfg.session_options(), &cache);
  FacadeOptions fopts;
  fopts.image = cfg.image_target();
  fopts.default_gallery = cfg.gallery;
  CommandFacade facade(session, cache, fopts);
  GallerySyncEngine engine(session, cache, cfg.sync_options());
  g_prompt_session = &session;

  LOGI("Device " << session.address() << "; probing...");
  {
    DeviceStatus st;
    DeviceError err;
    unblock_sigint_in_this_thread();
    bool ok = cache.refresh(session, st, err, &g_stop);
    block_sigint_in_this_thread();
    if (ok) {
      LOGI("Connected: " << (st.name.empty() ? session.address() : st.name)
           << (st.battery_percent >= 0 ? ", battery " + std::to_string(st.battery_percent) + "%" : std::string()));
    } else if (!g_stop.load()) {
      LOGW("Device not answering (" << error_to_name(err.kind) << "); it may be asleep. Commands will wake it.");
    }
  }
  if (g_stop.load()) return 0;

  if (pipe(g_wake_pipe) == 0) {
    fcntl(g_wake_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(g_wake_pipe[1], F_SETFL, O_NONBLOCK);
  }

  if (cfg.poll_interval_ms > 0) {
    g_poll_thread = std::thread(poll_loop, std::ref(cache), std::ref(session),
                                std::chrono::milliseconds(cfg.poll_interval_ms), verbose);
  }

  std::thread inputThread([&]() {
    unblock_sigint_in_this_thread();

    // history setup
    History* hist = history_init();
    HistEvent ev{};
    history(hist, &ev, H_SETSIZE, 1000);
    std::error_code ec;
    std::filesystem::create_directories(get_cache_dir(), ec);
    const std::string histfile = join_path(get_cache_dir(), "history");
    history(hist, &ev, H_LOAD, histfile.c_str());
    history(hist, &ev, H_SETUNIQUE, 1);

    // line editor setup
    EditLine* el = el_init("inkshell", stdin, stdout, stderr);
    el_set(el, EL_GETCFN, my_getc);
    el_set(el, EL_PROMPT, &prompt);
    el_set(el, EL_EDITOR, "emacs");
    el_set(el, EL_HIST, history, hist);
    el_set(el, EL_SIGNAL, 0); // our SIGINT handler controls shutdown
    el_set(el, EL_ADDFN, "my-complete", "Complete commands", &complete);
    el_set(el, EL_BIND, "\t", "my-complete", NULL);

    log_attach_repl(g_wake_pipe[1]);
    (void)drain_logs_and_refresh(nullptr);

    auto run_op = [&](const Operation& op, OperationOutcome& out, DeviceError& err) {
      return facade.perform(op, out, err, &g_cmd_cancel);
    };
    auto simple_op = [&](OperationKind kind, const char* tag, const char* done) -> int {
      OperationOutcome out;
      DeviceError err;
      if (!run_op(make_operation(kind), out, err)) return report(tag, err);
      LOGI(done);
      return 0;
    };

    using Handler = std::function<int(const std::vector<std::string>&)>;
    std::unordered_map<std::string, Handler> cmd{
      {"help", [&](auto const&)->int {
        log_command_overview();
        return 0;
      }},
      {"?", [&](auto const& args)->int {
        return cmd.at("help")(args);
      }},
      {"state", [&](auto const&)->int {
        LOGI("Session " << session.address() << ": " << state_name(session.state())
             << (session.busy() ? " (busy)" : ""));
        if (auto lc = session.last_contact()) LOGI("  last contact    " << format_timestamp(*lc));
        else LOGI("  last contact    never");
        DeviceError last = session.last_error();
        if (!last.ok()) LOGI("  last error      " << last.describe());
        LOGI("  sync            " << (g_sync_running.load() ? "running" : "idle"));
        return 0;
      }},
      {"status", [&](auto const& args)->int {
        long long max_age_s = 60;
        if (args.size() >= 2 && !parse_int_arg(args[1], 0, 1LL << 31, max_age_s)) {
          LOGE("usage: status [max_age_seconds]");
          return 2;
        }
        auto st = facade.get_status(std::chrono::seconds(max_age_s));
        if (!st) {
          auto age = cache.age();
          if (age) LOGW("Status is stale (" << age->count() / 1000 << " s old); run 'info' to refresh.");
          else LOGW("No status yet; run 'info' to fetch it.");
          return 0;
        }
        log_status(*st, cache.age());
        return 0;
      }},
      {"info", [&](auto const&)->int {
        DeviceStatus st;
        DeviceError err;
        if (!facade.refresh_status(st, err, &g_cmd_cancel)) return report("info", err);
        log_status(st, std::nullopt);
        return 0;
      }},
      {"refresh", [&](auto const& args)->int {
        return cmd.at("info")(args);
      }},
      {"next", [&](auto const&)->int {
        return simple_op(OperationKind::NextImage, "next", "Showing next image.");
      }},
      {"sleep", [&](auto const&)->int {
        return simple_op(OperationKind::Sleep, "sleep", "Device going to sleep.");
      }},
      {"reboot", [&](auto const&)->int {
        return simple_op(OperationKind::Reboot, "reboot", "Reboot requested.");
      }},
      {"clear", [&](auto const&)->int {
        return simple_op(OperationKind::ClearScreen, "clear", "Screen cleared.");
      }},
      {"wake", [&](auto const&)->int {
        return simple_op(OperationKind::Wake, "wake", "Device is awake.");
      }},
      {"whistle", [&](auto const& args)->int {
        return cmd.at("wake")(args);
      }},
      {"settings", [&](auto const& args)->int {
        Operation op = make_operation(OperationKind::UpdateSettings);
        std::string perr;
        if (!parse_settings_args(args, op.settings, perr)) {
          LOGE("settings: " << perr);
          return 2;
        }
        if (op.settings.empty()) op.settings.sleep_duration = cfg.sleep_duration;
        OperationOutcome out;
        DeviceError err;
        if (!run_op(op, out, err)) return report("settings", err);
        LOGI("Settings updated: " << encode_settings_json(op.settings));
        return 0;
      }},
      {"push", [&](auto const& args)->int {
        if (args.size() < 2) {
          LOGE("usage: push <file> [gallery]");
          return 2;
        }
        Operation op = make_operation(OperationKind::PushImage);
        std::string rerr;
        if (!read_file_bytes(expand_user_path(args[1]), op.image, rerr)) {
          LOGE("push: " << rerr);
          return 2;
        }
        op.gallery = args.size() >= 3 ? args[2] : cfg.gallery;
        OperationOutcome out;
        DeviceError err;
        if (!run_op(op, out, err)) return report("push", err);
        LOGI("Pushed " << basename_from_path(args[1]) << " -> " << out.image_path);
        run_post_cmd_args(cfg.post_cmd, {out.image_path, op.gallery, "pushed"});
        return 0;
      }},
      {"show", [&](auto const& args)->int {
        if (args.size() < 3) {
          LOGE("usage: show <gallery> <file> [single|slideshow|playlist] [duration] [dither]");
          return 2;
        }
        Operation op = make_operation(OperationKind::ShowImage);
        op.show.gallery = args[1];
        op.show.filename = args[2];
        long long n = 0;
        if (args.size() >= 4 && !parse_play_type(args[3], op.show.play_type)) {
          LOGE("show: unknown play type '" << args[3] << "'");
          return 2;
        }
        if (args.size() >= 5) {
          if (!parse_int_arg(args[4], 1, 1LL << 30, n)) { LOGE("show: invalid duration"); return 2; }
          op.show.duration = static_cast<int>(n);
        }
        if (args.size() >= 6) {
          if (!parse_int_arg(args[5], 0, 1, n)) { LOGE("show: dither must be 0 or 1"); return 2; }
          op.show.dither = static_cast<int>(n);
        }
        OperationOutcome out;
        DeviceError err;
        if (!run_op(op, out, err)) return report("show", err);
        LOGI("Showing " << gallery_image_path(op.show.gallery, op.show.filename)
             << " (" << play_type_name(op.show.play_type) << ")");
        return 0;
      }},
      {"galleries", [&](auto const&)->int {
        OperationOutcome out;
        DeviceError err;
        if (!run_op(make_operation(OperationKind::ListGalleries), out, err)) return report("galleries", err);
        if (out.galleries.empty()) LOGI("No galleries.");
        for (const auto& g : out.galleries) LOGI("  " << g.name);
        return 0;
      }},
      {"gallery", [&](auto const& args)->int {
        Operation op = make_operation(OperationKind::ListGalleryImages);
        op.gallery = args.size() >= 2 ? args[1] : cfg.gallery;
        long long n = 0;
        if (args.size() >= 3) {
          if (!parse_int_arg(args[2], 0, 1LL << 30, n)) { LOGE("gallery: invalid offset"); return 2; }
          op.offset = static_cast<int>(n);
        }
        if (args.size() >= 4) {
          if (!parse_int_arg(args[3], 1, 1000, n)) { LOGE("gallery: invalid limit"); return 2; }
          op.limit = static_cast<int>(n);
        }
        OperationOutcome out;
        DeviceError err;
        if (!run_op(op, out, err)) return report("gallery", err);
        LOGI("Gallery '" << op.gallery << "': " << out.page.images.size() << " of " << out.page.total
             << " (offset " << op.offset << ")");
        for (const auto& img : out.page.images) {
          LOGI("  " << std::left << std::setw(28) << img.name << " " << std::right << std::setw(9) << img.size << " bytes");
        }
        return 0;
      }},
      {"sync", [&](auto const& args)->int {
        // usage: sync <dir> [gallery] [max] [overwrite] | sync stop
        if (args.size() >= 2 && to_lower_ascii(args[1]) == "stop") {
          if (!g_sync_running.load(std::memory_order_acquire)) {
            LOGI("Sync: nothing to stop.");
            return 0;
          }
          g_sync_abort.store(true, std::memory_order_release);
          LOGI("Sync: stopping (will finish current item and then stop).");
          return 0;
        }
        if (args.size() < 2) {
          LOGE("usage: sync <dir> [gallery] [max] [overwrite] | sync stop");
          return 2;
        }
        const std::string dir = expand_user_path(args[1]);
        std::error_code fec;
        if (!std::filesystem::is_directory(dir, fec)) {
          LOGE("sync: not a directory: " << dir);
          return 2;
        }
        SyncRequest req;
        req.gallery = args.size() >= 3 ? args[2] : cfg.gallery;
        req.max_photos = cfg.max_photos;
        long long n = 0;
        if (args.size() >= 4) {
          if (!parse_int_arg(args[3], 1, 1LL << 30, n)) { LOGE("sync: invalid max '" << args[3] << "'"); return 2; }
          req.max_photos = static_cast<std::size_t>(n);
        }
        if (args.size() >= 5) {
          const std::string flag = to_lower_ascii(args[4]);
          if (flag != "overwrite" && !parse_bool_value(flag, req.overwrite_existing)) {
            LOGE("sync: expected 'overwrite', got '" << args[4] << "'");
            return 2;
          }
          if (flag == "overwrite") req.overwrite_existing = true;
        }

        bool expected_running = false;
        if (!g_sync_running.compare_exchange_strong(expected_running, true, std::memory_order_acq_rel)) {
          LOGW("Sync already in progress. Use `sync stop` to cancel.");
          return 0;
        }
        if (g_sync_thread.joinable()) g_sync_thread.join();
        g_sync_abort.store(false, std::memory_order_release);

        LOGI("Sync: " << dir << " -> gallery '" << req.gallery << "' (max " << req.max_photos
             << (req.overwrite_existing ? ", overwrite" : ", skip existing") << ")...");

        // worker thread so the REPL stays responsive
        g_sync_thread = std::thread([&engine, &cfg, dir, req]() mutable {
          struct SyncRunningReset {
            ~SyncRunningReset() { g_sync_running.store(false, std::memory_order_release); }
          } _sync_reset_guard;

          DirectoryMediaSource source(dir);
          req.source = &source;
          const std::string post_cmd = cfg.post_cmd;
          SyncResult result = engine.sync(req, &g_sync_abort, [&](const SyncItemReport& rep) {
            if (rep.outcome == SyncOutcome::Uploaded || rep.outcome == SyncOutcome::Overwritten) {
              LOGI("Sync: " << sync_outcome_name(rep.outcome) << " " << basename_from_path(rep.source_id)
                   << " -> " << rep.device_path);
              run_post_cmd_args(post_cmd, {rep.device_path, req.gallery, sync_outcome_name(rep.outcome)});
            }
          });
          if (!source.scan_error().empty()) LOGW("Sync: directory scan: " << source.scan_error());

          if (result.aborted) {
            LOGE("Sync aborted: " << result.abort_error.describe());
            return;
          }
          LOGI("Sync " << (result.cancelled ? "stopped" : "done") << ": " << result.summary());
          size_t shown = 0;
          for (const auto& f : result.failures) {
            if (++shown > 5) {
              LOGW("  ... " << (result.failures.size() - 5) << " more failure(s)");
              break;
            }
            LOGW("  " << basename_from_path(f.source_id) << ": " << error_to_name(f.kind) << " " << f.detail);
          }
        });
        return 0;
      }},
      {"quit", [&](auto const&)->int {
        g_stop.store(true, std::memory_order_relaxed);
        return 99;
      }},
      {"exit", [&](auto const&)->int {
        g_stop.store(true, std::memory_order_relaxed);
        return 99;
      }},
    };

    auto run_cli_command = [&](const std::vector<std::string>& args) -> int {
      if (args.empty()) return 0;
      auto it = cmd.find(to_lower_ascii(args[0]));
      if (it == cmd.end()) {
        LOGE("Unknown command: " << args[0] << " (try 'help')");
        return 2;
      }
      g_cmd_cancel.store(false, std::memory_order_relaxed);
      return it->second(args);
    };

    while (!g_stop.load(std::memory_order_relaxed)) {
      (void)drain_logs_and_refresh(nullptr);
      if (g_stop.load(std::memory_order_relaxed)) break;

      int count = 0;
      errno = 0;
      const char* s = el_gets(el, &count);

      if (!s) {
        if (g_stop.load()) break;
        if (errno == EINTR) continue;
        if (feof(stdin)) { g_stop.store(true); break; }
        if (count == 0 && errno == 0) { g_stop.store(true); break; }

        if (g_wake_pipe[0] != -1) {
          char buf[256];
          while (true) {
            ssize_t n = read(g_wake_pipe[0], buf, sizeof(buf));
            if (n <= 0) break;
          }
        }
        log_clear_wake();
        (void)drain_logs_and_refresh(nullptr);
        continue;
      }

      std::string line(s, count);
      if (!line.empty() && line.back() == '\n') line.pop_back();
      if (trim_copy(line).empty()) continue;

      history(hist, &ev, H_ENTER, line.c_str());

      int rc = run_cli_command(tokenize(line));
      if (rc == 99) break;

      drain_logs_and_refresh(nullptr);
    }

    history(hist, &ev, H_SAVE, histfile.c_str());
    history_end(hist);
    el_end(el);

    log_detach_repl();

    // Ensure the prompt line is cleared so shutdown logs start cleanly
    std::fputs("\r\033[K", stdout);
    std::fflush(stdout);
  });

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // 1) Stop the REPL first so it cannot redraw a prompt during shutdown.
  wake_repl_loop();
  if (inputThread.joinable()) inputThread.join();

  // 2) Cancel background work and wait for it.
  if (verbose) LOGI("Shutting down...");
  g_sync_abort.store(true, std::memory_order_release);
  g_cmd_cancel.store(true, std::memory_order_release);
  if (g_sync_thread.joinable()) {
    if (g_sync_running.load(std::memory_order_acquire)) {
      LOGI("Waiting for the current sync item to finish (Ctrl-C twice to force)...");
    }
    g_sync_thread.join();
  }
  if (g_poll_thread.joinable()) g_poll_thread.join();

  if (g_wake_pipe[0] != -1) { close(g_wake_pipe[0]); g_wake_pipe[0] = -1; }
  if (g_wake_pipe[1] != -1) { close(g_wake_pipe[1]); g_wake_pipe[1] = -1; }
  g_prompt_session = nullptr;
  return 0;
}
