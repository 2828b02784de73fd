#include "tui.h"

#include "util.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

using strata::tui::level;

namespace {

constexpr std::size_t kSeverityLabelWidth{ 3 };

struct log_event {
  std::chrono::system_clock::time_point timestamp;
  level severity;
  std::string message;
};

using log_entry = std::variant<log_event, strata::trace_event_t>;

// Convergence is single-threaded, so entries are written synchronously under the
// mutex. Entries logged before run() are held and flushed when run() starts.
struct tui_state {
  std::deque<log_entry> pending;
  std::function<void(std::string_view)> output_handler;
  std::mutex mutex;
  std::mutex stdout_mutex;
  std::optional<level> level_threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };
  bool trace_stderr{ false };
  strata::file_ptr_t trace_file;
} s_tui{};

std::string_view level_to_string(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::string format_prefix(level severity, std::chrono::system_clock::time_point when) {
  if (!s_tui.decorated) { return {}; }

  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(when - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(when) };
  std::tm local_tm{};
  localtime_r(&timestamp, &local_tm);

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << std::left << std::setfill(' ') << std::setw(kSeverityLabelWidth)
      << level_to_string(severity) << "] ";
  return oss.str();
}

void emit_line(std::string const &line) {
  if (s_tui.output_handler) {
    s_tui.output_handler(line);
    return;
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

// Caller holds s_tui.mutex.
void write_entry_locked(log_entry const &entry) {
  if (auto const *log_ptr{ std::get_if<log_event>(&entry) }) {
    std::string output{ format_prefix(log_ptr->severity, log_ptr->timestamp) };
    output.append(log_ptr->message);
    output.push_back('\n');
    emit_line(output);
    return;
  }

  auto const &event{ std::get<strata::trace_event_t>(entry) };

  if (s_tui.trace_stderr) {
    std::string output{ format_prefix(level::TUI_TRACE, std::chrono::system_clock::now()) };
    output.append(strata::trace_event_to_string(event));
    output.push_back('\n');
    emit_line(output);
  }

  if (s_tui.trace_file) {
    auto const json{ strata::trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), s_tui.trace_file.get()) != json.size() ||
        std::fflush(s_tui.trace_file.get()) != 0) {
      // Tracing never fails the run; drop the file sink and say so once.
      s_tui.trace_file.reset();
      strata::tui::g_trace_enabled = s_tui.trace_stderr;
      std::string output{ format_prefix(level::TUI_ERROR, std::chrono::system_clock::now()) };
      output.append("Trace file write failed; file tracing disabled\n");
      emit_line(output);
    }
  }
}

void submit(log_entry entry) {
  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  if (!s_tui.running) {
    s_tui.pending.push_back(std::move(entry));
    return;
  }
  write_entry_locked(entry);
}

void log_formatted(level severity, char const *fmt, va_list args) {
  if (!s_tui.initialized || fmt == nullptr) { return; }
  if (s_tui.level_threshold && severity < *s_tui.level_threshold) { return; }

  std::string buffer(512, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written < 0) {
    va_end(args_copy);
    return;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written < 0) { return; }
  buffer.resize(static_cast<std::size_t>(written));

  submit(log_entry{ log_event{ .timestamp = std::chrono::system_clock::now(),
                               .severity = severity,
                               .message = std::move(buffer) } });
}

}  // namespace

bool strata::tui::g_trace_enabled{ false };

namespace strata::tui {

void init() {
  if (s_tui.initialized) {
    throw std::logic_error{ "strata::tui::init called more than once" };
  }

  s_tui.level_threshold = std::nullopt;
  s_tui.decorated = false;
  s_tui.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "strata::tui::configure_trace_outputs called before init" };
  }

  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  if (s_tui.running) {
    throw std::logic_error{ "strata::tui::configure_trace_outputs called while running" };
  }

  s_tui.trace_file.reset();
  s_tui.trace_stderr = false;

  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      s_tui.trace_stderr = true;
    } else if (spec.type == trace_output_type::file && spec.file_path) {
      if (s_tui.trace_file) {
        throw std::logic_error{ "Only one trace file output supported" };
      }
      s_tui.trace_file = util_open_file(*spec.file_path, "w");
      if (!s_tui.trace_file) {
        throw std::runtime_error("Failed to open trace file: " + spec.file_path->string());
      }
    }
  }

  g_trace_enabled = s_tui.trace_stderr || s_tui.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  if (s_tui.running) {
    throw std::logic_error{ "strata::tui::set_output_handler called while running" };
  }
  s_tui.output_handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "strata::tui::run called before init" };
  }

  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  if (s_tui.running) {
    throw std::logic_error{ "strata::tui::run called while already running" };
  }

  s_tui.level_threshold = std::move(threshold);
  s_tui.decorated = decorated_logging;
  s_tui.running = true;

  while (!s_tui.pending.empty()) {
    auto entry{ std::move(s_tui.pending.front()) };
    s_tui.pending.pop_front();
    if (auto const *log_ptr{ std::get_if<log_event>(&entry) };
        log_ptr && s_tui.level_threshold && log_ptr->severity < *s_tui.level_threshold) {
      continue;
    }
    write_entry_locked(entry);
  }
}

void shutdown() {
  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  if (!s_tui.running) {
    throw std::logic_error{ "strata::tui::shutdown called while not running" };
  }

  s_tui.running = false;
  g_trace_enabled = false;
  s_tui.trace_stderr = false;
  s_tui.trace_file.reset();
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }
  submit(log_entry{ std::move(event) });
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_tui.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace strata::tui
