#include "vigil/core/logger.h"

#include "vigil/core/error.h"
#include "vigil/core/json.h"
#include "vigil/core/time.h"

#include <iostream>
#include <kj/debug.h>

namespace vigil::core {

// ============================================================================
// LogLevel
// ============================================================================

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Critical:
    return "CRITICAL"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  return "UNKNOWN"_kj;
}

kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name) {
  auto lower = kj::heapString(name);
  for (char& c : lower) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  if (lower == "trace") {
    return LogLevel::Trace;
  }
  if (lower == "debug") {
    return LogLevel::Debug;
  }
  if (lower == "info") {
    return LogLevel::Info;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  }
  if (lower == "error") {
    return LogLevel::Error;
  }
  if (lower == "critical") {
    return LogLevel::Critical;
  }
  if (lower == "off") {
    return LogLevel::Off;
  }
  return kj::none;
}

// ============================================================================
// TextFormatter
// ============================================================================

kj::String TextFormatter::colorize(LogLevel level, kj::StringPtr text) const {
  kj::StringPtr color_code = "\033[0m"_kj;
  switch (level) {
  case LogLevel::Trace:
    color_code = "\033[90m"_kj;
    break;
  case LogLevel::Debug:
    color_code = "\033[36m"_kj;
    break;
  case LogLevel::Info:
    color_code = "\033[32m"_kj;
    break;
  case LogLevel::Warn:
    color_code = "\033[33m"_kj;
    break;
  case LogLevel::Error:
    color_code = "\033[31m"_kj;
    break;
  case LogLevel::Critical:
    color_code = "\033[35m"_kj;
    break;
  case LogLevel::Off:
    break;
  }
  return kj::str(color_code, text, "\033[0m"_kj);
}

kj::String TextFormatter::format(const LogEntry& entry) const {
  auto label = kj::str("[", to_string(entry.level), "]");
  auto level_part = use_color_ ? colorize(entry.level, label) : kj::mv(label);

  auto location = include_function_ ? kj::str(entry.file, ":", entry.line, " ", entry.function)
                                    : kj::str(entry.file, ":", entry.line);

  KJ_IF_SOME(payload, entry.payload) {
    return kj::str("[", entry.timestamp, "] ", level_part, " ", location, " - ", entry.message,
                   " ", payload);
  }
  return kj::str("[", entry.timestamp, "] ", level_part, " ", location, " - ", entry.message);
}

// ============================================================================
// JsonFormatter
// ============================================================================

kj::String JsonFormatter::format(const LogEntry& entry) const {
  auto builder = JsonBuilder::object();
  builder.put("timestamp", entry.timestamp.asPtr())
      .put("level", to_string(entry.level))
      .put("file", entry.file.asPtr())
      .put("line", static_cast<int64_t>(entry.line))
      .put("function", entry.function.asPtr())
      .put("message", entry.message.asPtr());
  KJ_IF_SOME(payload, entry.payload) {
    builder.put_raw("payload", payload);
  }
  return builder.build(pretty_);
}

// ============================================================================
// ConsoleOutput
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  std::ostream* out = &std::cout;
  if (use_stderr_ || entry.level == LogLevel::Error || entry.level == LogLevel::Critical) {
    out = &std::cerr;
  }
  out->write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  *out << '\n';
}

void ConsoleOutput::flush() {
  std::cout.flush();
  std::cerr.flush();
}

// ============================================================================
// FileOutput
// ============================================================================

FileOutput::FileOutput(kj::StringPtr file_path) : path_(kj::str(file_path)) {
  auto lock = guarded_.lockExclusive();
  lock->stream.open(path_.cStr(), std::ios::out | std::ios::app);
  if (!lock->stream.is_open()) {
    throw ResourceException(kj::str("Failed to open log file: ", path_));
  }
}

FileOutput::~FileOutput() noexcept {
  auto lock = guarded_.lockExclusive();
  if (lock->stream.is_open()) {
    lock->stream.close();
  }
}

void FileOutput::write(kj::StringPtr formatted, const LogEntry& /* entry */) {
  auto lock = guarded_.lockExclusive();
  if (!lock->stream.is_open()) {
    throw ResourceException(kj::str("Log file is closed: ", path_));
  }
  lock->stream.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  lock->stream << '\n';
  lock->stream.flush();
  if (!lock->stream.good()) {
    throw ResourceException(kj::str("Failed to write log file: ", path_));
  }
  lock->bytes_written += formatted.size() + 1;
}

void FileOutput::flush() {
  auto lock = guarded_.lockExclusive();
  if (lock->stream.is_open()) {
    lock->stream.flush();
  }
}

bool FileOutput::is_open() const {
  return guarded_.lockExclusive()->stream.is_open();
}

size_t FileOutput::bytes_written() const {
  return guarded_.lockExclusive()->bytes_written;
}

// ============================================================================
// MemoryOutput
// ============================================================================

void MemoryOutput::write(kj::StringPtr formatted, const LogEntry& /* entry */) {
  lines_.lockExclusive()->add(kj::str(formatted));
}

kj::Vector<kj::String> MemoryOutput::lines() const {
  auto lock = lines_.lockExclusive();
  kj::Vector<kj::String> copy(lock->size());
  for (auto& line : *lock) {
    copy.add(kj::str(line));
  }
  return copy;
}

size_t MemoryOutput::size() const {
  return lines_.lockExclusive()->size();
}

void MemoryOutput::clear() {
  lines_.lockExclusive()->clear();
}

// ============================================================================
// MultiOutput
// ============================================================================

void MultiOutput::add_output(kj::Own<LogOutput> output) {
  outputs_.lockExclusive()->add(kj::mv(output));
}

void MultiOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  auto lock = outputs_.lockExclusive();
  for (auto& output : *lock) {
    output->write(formatted, entry);
  }
}

void MultiOutput::flush() {
  auto lock = outputs_.lockExclusive();
  for (auto& output : *lock) {
    output->flush();
  }
}

bool MultiOutput::is_open() const {
  return !outputs_.lockExclusive()->empty();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output)
    : guarded_(kj::mv(formatter), kj::mv(output)) {}

Logger::~Logger() = default;

void Logger::set_level(LogLevel level) {
  guarded_.lockExclusive()->level = level;
}

LogLevel Logger::level() const {
  return guarded_.lockExclusive()->level;
}

bool Logger::enabled(LogLevel level) const {
  auto current = this->level();
  return current != LogLevel::Off && level != LogLevel::Off &&
         static_cast<int>(level) >= static_cast<int>(current);
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  guarded_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::set_output(kj::Own<LogOutput> output) {
  auto lock = guarded_.lockExclusive();
  lock->multi_output = kj::heap<MultiOutput>();
  lock->multi_output->add_output(kj::mv(output));
}

void Logger::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->multi_output->add_output(kj::mv(output));
}

void Logger::write_entry(LogLevel level, kj::StringPtr message, kj::Maybe<kj::StringPtr> payload,
                         const std::source_location& location) {
  auto lock = guarded_.lockExclusive();
  if (lock->level == LogLevel::Off || level == LogLevel::Off ||
      static_cast<int>(level) < static_cast<int>(lock->level)) {
    return;
  }

  // Keep only the file's base name
  kj::StringPtr path = location.file_name();
  const char* base = path.end();
  while (base > path.begin() && base[-1] != '/' && base[-1] != '\\') {
    --base;
  }

  kj::Maybe<kj::String> payload_copy;
  KJ_IF_SOME(p, payload) {
    payload_copy = kj::str(p);
  }

  LogEntry entry{.level = level,
                 .timestamp = now_utc_iso8601(),
                 .file = kj::heapString(base, static_cast<size_t>(path.end() - base)),
                 .line = static_cast<int_least32_t>(location.line()),
                 .function = kj::heapString(location.function_name()),
                 .message = kj::heapString(message),
                 .payload = kj::mv(payload_copy),
                 .time_point = std::chrono::system_clock::now()};

  auto formatted = lock->formatter->format(entry);
  lock->multi_output->write(formatted, entry);
}

void Logger::log(LogLevel level, kj::StringPtr message, const std::source_location& location) {
  write_entry(level, message, kj::none, location);
}

void Logger::log_json(LogLevel level, kj::StringPtr message, kj::StringPtr payload_json,
                      const std::source_location& location) {
  write_entry(level, message, payload_json, location);
}

void Logger::debug(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Debug, message, location);
}

void Logger::info(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Info, message, location);
}

void Logger::warn(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Warn, message, location);
}

void Logger::error(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Error, message, location);
}

void Logger::critical(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Critical, message, location);
}

void Logger::flush() {
  guarded_.lockExclusive()->multi_output->flush();
}

// ============================================================================
// Global Logger
// ============================================================================

namespace {

struct GlobalLoggerState {
  kj::Maybe<kj::Own<Logger>> logger;
};

kj::MutexGuarded<GlobalLoggerState> g_global_logger;

} // namespace

Logger& global_logger() {
  auto lock = g_global_logger.lockExclusive();
  KJ_IF_SOME(logger, lock->logger) {
    return *logger;
  }
  auto created = kj::heap<Logger>(kj::heap<TextFormatter>(false, false), kj::heap<ConsoleOutput>());
  Logger& ref = *created;
  lock->logger = kj::mv(created);
  return ref;
}

} // namespace vigil::core
