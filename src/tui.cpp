#include "tui.h"

#include "platform.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <variant>

using uvk::tui::level;

namespace {

constexpr std::chrono::milliseconds kDrainInterval{ 33 };

struct log_record {
  level severity;
  std::string text;
};

using record = std::variant<log_record, uvk::trace_event_t>;
using handler_fn = std::function<void(std::string_view)>;

// Process-wide sink. Producers append under `queue_mutex`; a single drain thread formats
// and writes. Handler, threshold, tag and trace outputs only change while the drain thread
// is stopped.
struct sink {
  std::mutex queue_mutex;
  std::condition_variable_any wake;
  std::deque<record> queue;
  std::jthread drain;

  std::mutex stdout_mutex;

  handler_fn handler;
  std::optional<level> threshold;
  std::string tag;
  bool decorated{ false };
  bool initialized{ false };
  bool stopping{ false };

  bool trace_to_stderr{ false };
  std::FILE *trace_jsonl{ nullptr };

  void close_trace_file() {
    if (trace_jsonl) {
      std::fclose(trace_jsonl);
      trace_jsonl = nullptr;
    }
  }
} g_sink;

char const *severity_label(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2026-01-31 12:00:00.123] [INF] [tag] "; empty when decoration is off.
std::string decoration(level severity) {
  if (!g_sink.decorated) { return {}; }

  auto const now{ std::chrono::system_clock::now() };
  auto const since_epoch{ now.time_since_epoch() };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() %
                 1000 };
  std::time_t const secs{ std::chrono::system_clock::to_time_t(now) };
  std::tm local{};
  localtime_r(&secs, &local);

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char head[64]{};
  std::snprintf(head,
                sizeof head,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(ms),
                severity_label(severity));

  std::string out{ head };
  if (!g_sink.tag.empty()) { out += "[" + g_sink.tag + "] "; }
  return out;
}

std::optional<std::string> vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return std::nullopt; }

  std::string text(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<std::size_t>(needed));
  return text;
}

class writer {
 public:
  explicit writer(handler_fn const &handler) : handler_{ handler } {}

  ~writer() {
    if (!handler_ && dirty_) { std::fflush(stderr); }
  }

  void line(std::string text) {
    text.push_back('\n');
    if (handler_) {
      handler_(text);
      return;
    }
    std::fwrite(text.data(), 1, text.size(), stderr);
    dirty_ = true;
  }

  void operator()(log_record const &rec) { line(decoration(rec.severity) + rec.text); }

  void operator()(uvk::trace_event_t const &ev) {
    if (g_sink.trace_to_stderr) {
      line(decoration(level::TUI_TRACE) + uvk::trace_event_to_string(ev));
    }
    if (!g_sink.trace_jsonl) { return; }

    auto const json{ uvk::trace_event_to_json(ev) + "\n" };
    bool const ok{ std::fwrite(json.data(), 1, json.size(), g_sink.trace_jsonl) ==
                       json.size() &&
                   std::fflush(g_sink.trace_jsonl) == 0 };
    if (!ok) {
      g_sink.close_trace_file();
      std::fputs("[uvk: trace file write failed, file tracing disabled]\n", stderr);
      dirty_ = true;
    }
  }

 private:
  handler_fn const &handler_;
  bool dirty_{ false };
};

void write_batch(std::deque<record> batch) {
  writer w{ g_sink.handler };
  for (auto const &rec : batch) { std::visit(w, rec); }
}

void drain_loop(std::stop_token stop) {
  std::unique_lock lock{ g_sink.queue_mutex };
  for (;;) {
    g_sink.wake.wait_for(lock, stop, kDrainInterval, [] { return !g_sink.queue.empty(); });

    std::deque<record> batch;
    batch.swap(g_sink.queue);
    bool const last{ stop.stop_requested() };
    lock.unlock();

    try {
      write_batch(std::move(batch));
    } catch (std::exception const &e) {
      std::fprintf(stderr, "[uvk: log writer failed: %s]\n", e.what());
      std::fflush(stderr);
    }

    lock.lock();
    // Producers may have queued more between the swap and the stop request.
    if (last && g_sink.queue.empty()) { return; }
  }
}

void enqueue(record rec) {
  {
    std::lock_guard lock{ g_sink.queue_mutex };
    g_sink.queue.push_back(std::move(rec));
  }
  g_sink.wake.notify_one();
}

void log_va(level severity, char const *fmt, va_list args) {
  if (!g_sink.initialized || !fmt) { return; }
  if (g_sink.threshold && severity < *g_sink.threshold) { return; }
  if (auto text{ vformat(fmt, args) }) {
    enqueue(log_record{ .severity = severity, .text = std::move(*text) });
  }
}

void require_stopped(char const *what) {
  if (!g_sink.initialized) {
    throw std::logic_error{ std::string{ "uvk::tui::" } + what + " called before init" };
  }
  if (g_sink.drain.joinable() || g_sink.stopping) {
    throw std::logic_error{ std::string{ "uvk::tui::" } + what + " called while running" };
  }
}

}  // namespace

bool uvk::tui::g_trace_enabled{ false };

namespace uvk::tui {

void init() {
  if (g_sink.initialized) { throw std::logic_error{ "uvk::tui::init called more than once" }; }
  g_sink.initialized = true;
  g_sink.threshold.reset();
  g_sink.decorated = false;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_stopped("configure_trace_outputs");

  g_sink.close_trace_file();
  g_sink.trace_to_stderr = false;

  for (auto const &out : outputs) {
    switch (out.type) {
      case trace_output_type::std_err: g_sink.trace_to_stderr = true; break;
      case trace_output_type::file:
        if (!out.file_path) { break; }
        if (g_sink.trace_jsonl) {
          throw std::logic_error{ "Only one trace file output supported" };
        }
        g_sink.trace_jsonl = std::fopen(out.file_path->c_str(), "w");
        if (!g_sink.trace_jsonl) {
          throw std::runtime_error{ "Failed to open trace file: " + out.file_path->string() };
        }
        break;
    }
  }

  g_trace_enabled = g_sink.trace_to_stderr || g_sink.trace_jsonl != nullptr;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_stopped("set_output_handler");
  g_sink.handler = std::move(handler);
}

void set_source_tag(std::string tag) {
  require_stopped("set_source_tag");
  g_sink.tag = std::move(tag);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!g_sink.initialized) { throw std::logic_error{ "uvk::tui::run called before init" }; }
  if (g_sink.drain.joinable()) {
    throw std::logic_error{ "uvk::tui::run called while already running" };
  }

  g_sink.threshold = threshold;
  g_sink.decorated = decorated_logging;
  g_sink.drain = std::jthread{ drain_loop };
}

void shutdown() {
  if (!g_sink.drain.joinable()) {
    throw std::logic_error{ "uvk::tui::shutdown called while not running" };
  }

  g_sink.stopping = true;
  g_sink.drain.request_stop();
  g_sink.drain.join();
  g_sink.drain = std::jthread{};
  g_sink.stopping = false;

  g_trace_enabled = false;
  g_sink.close_trace_file();
}

bool is_tty() { return platform::is_tty(); }

void trace(trace_event_t event) {
  if (g_trace_enabled) { enqueue(std::move(event)); }
}

#define UVK_TUI_LOG_FN(name, severity) \
  void name(char const *fmt, ...) {    \
    va_list args;                      \
    va_start(args, fmt);               \
    log_va(severity, fmt, args);       \
    va_end(args);                      \
  }

UVK_TUI_LOG_FN(debug, level::TUI_DEBUG)
UVK_TUI_LOG_FN(info, level::TUI_INFO)
UVK_TUI_LOG_FN(warn, level::TUI_WARN)
UVK_TUI_LOG_FN(error, level::TUI_ERROR)

#undef UVK_TUI_LOG_FN

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  va_list args;
  va_start(args, fmt);
  std::lock_guard lock{ g_sink.stdout_mutex };
  if (std::vprintf(fmt, args) > 0) { std::fflush(stdout); }
  va_end(args);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!g_sink.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace uvk::tui
