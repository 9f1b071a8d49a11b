#include "tui.h"
#include "util.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

using keel::tui::level;

namespace {

constexpr std::chrono::milliseconds kFlushInterval{ 33 };

struct log_line {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

using queued_entry = std::variant<log_line, keel::trace_event_t>;

struct logger_state {
  std::mutex mutex;  // guards queue, stopping
  std::condition_variable cv;
  std::vector<queued_entry> queue;
  bool stopping{ false };
  std::thread worker;

  std::function<void(std::string_view)> sink;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };

  bool trace_stderr{ false };
  std::FILE *trace_file{ nullptr };
};

logger_state s_log;

char const *severity_tag(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[YYYY-mm-dd HH:MM:SS.mmm] [LVL] "
std::string decoration(log_line const &line) {
  auto const secs{ std::chrono::time_point_cast<std::chrono::seconds>(line.when) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(line.when - secs).count()
  };
  std::time_t const t{ std::chrono::system_clock::to_time_t(line.when) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[24]{};
  std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  char out[64]{};
  std::snprintf(out,
                sizeof out,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(millis),
                severity_tag(line.severity));
  return out;
}

void write_out(std::string_view text) {
  if (s_log.sink) {
    s_log.sink(text);
  } else {
    std::fwrite(text.data(), 1, text.size(), stderr);
  }
}

void write_trace_file(keel::trace_event_t const &event) {
  if (!s_log.trace_file) { return; }
  auto const json{ keel::trace_event_to_json(event) + "\n" };
  if (std::fwrite(json.data(), 1, json.size(), s_log.trace_file) == json.size() &&
      std::fflush(s_log.trace_file) == 0) {
    return;
  }
  std::fprintf(stderr, "keel: trace file write failed, file tracing disabled\n");
  std::fclose(s_log.trace_file);
  s_log.trace_file = nullptr;
}

void drain(std::vector<queued_entry> &batch) {
  for (auto const &entry : batch) {
    std::visit(keel::match{
                   [](log_line const &line) {
                     std::string out{ s_log.decorated ? decoration(line) : std::string{} };
                     out += line.text;
                     out += '\n';
                     write_out(out);
                   },
                   [](keel::trace_event_t const &event) {
                     if (s_log.trace_stderr) {
                       write_out(keel::trace_event_to_string(event) + "\n");
                     }
                     write_trace_file(event);
                   },
               },
               entry);
  }
  batch.clear();
  if (!s_log.sink) { std::fflush(stderr); }
}

void worker_loop() {
  std::vector<queued_entry> batch;
  std::unique_lock lock{ s_log.mutex };
  for (;;) {
    s_log.cv.wait_for(lock, kFlushInterval, [] {
      return s_log.stopping || !s_log.queue.empty();
    });
    batch.swap(s_log.queue);
    bool const last{ s_log.stopping };

    lock.unlock();
    drain(batch);
    lock.lock();

    if (last && s_log.queue.empty()) { return; }
  }
}

void enqueue(queued_entry entry) {
  {
    std::lock_guard lock{ s_log.mutex };
    s_log.queue.push_back(std::move(entry));
  }
  s_log.cv.notify_one();
}

void vlog(level severity, char const *fmt, va_list args) {
  if (!s_log.initialized || !fmt) { return; }
  if (s_log.threshold && severity < *s_log.threshold) { return; }

  va_list sized;
  va_copy(sized, args);
  int const n{ std::vsnprintf(nullptr, 0, fmt, sized) };
  va_end(sized);
  if (n <= 0) { return; }

  std::string text(static_cast<std::size_t>(n) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<std::size_t>(n));

  enqueue(log_line{ .when = std::chrono::system_clock::now(),
                    .severity = severity,
                    .text = std::move(text) });
}

void require_idle(char const *what) {
  if (!s_log.initialized) { throw std::logic_error{ std::string{ what } + " before init" }; }
  if (s_log.worker.joinable()) {
    throw std::logic_error{ std::string{ what } + " while running" };
  }
}

}  // namespace

namespace keel::tui {

bool g_trace_enabled{ false };

void init() {
  if (s_log.initialized) { throw std::logic_error{ "keel::tui::init called twice" }; }
  s_log.initialized = true;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_idle("keel::tui::configure_trace_outputs");

  if (s_log.trace_file) {
    std::fclose(s_log.trace_file);
    s_log.trace_file = nullptr;
  }
  s_log.trace_stderr = false;

  for (auto const &out : outputs) {
    if (out.type == trace_output_type::std_err) {
      s_log.trace_stderr = true;
      continue;
    }
    if (!out.file_path) { continue; }
    if (s_log.trace_file) { throw std::logic_error{ "only one trace file is supported" }; }
    s_log.trace_file = std::fopen(out.file_path->string().c_str(), "w");
    if (!s_log.trace_file) {
      throw std::runtime_error("unable to open trace file " + out.file_path->string());
    }
  }

  g_trace_enabled = s_log.trace_stderr || s_log.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_idle("keel::tui::set_output_handler");
  s_log.sink = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  require_idle("keel::tui::run");
  s_log.threshold = threshold;
  s_log.decorated = decorated_logging;
  s_log.stopping = false;
  s_log.worker = std::thread{ worker_loop };
}

void shutdown() {
  if (!s_log.worker.joinable()) {
    throw std::logic_error{ "keel::tui::shutdown called while not running" };
  }
  {
    std::lock_guard lock{ s_log.mutex };
    s_log.stopping = true;
  }
  s_log.cv.notify_one();
  s_log.worker.join();

  g_trace_enabled = false;
  s_log.trace_stderr = false;
  if (s_log.trace_file) {
    std::fclose(s_log.trace_file);
    s_log.trace_file = nullptr;
  }
}

void trace(trace_event_t event) {
  if (g_trace_enabled) { enqueue(std::move(event)); }
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_ERROR, fmt, args);
  va_end(args);
}

// Command output bypasses the log queue; only the main thread prints it.
void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }
  va_list args;
  va_start(args, fmt);
  std::vprintf(fmt, args);
  va_end(args);
  std::fflush(stdout);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace keel::tui
