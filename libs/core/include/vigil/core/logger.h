/**
 * @file logger.h
 * @brief Levelled, thread-safe logging
 *
 * Log levels, formatters (human-readable text and one-line JSON), output
 * destinations (console, append-only file, in-memory capture, fan-out) and the
 * Logger that ties them together under a single mutex so that each entry is
 * written as one uninterrupted line.
 *
 * An entry may carry a structured JSON payload next to its message. The JSON
 * formatter embeds it as a nested object; the text formatter appends it after
 * the message.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace vigil::core {

/**
 * @brief Log level enumeration, from most detailed to most severe
 *
 * Off disables all output.
 */
enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Critical = 5,
  Off = 6,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Parse a level name ("trace", "INFO", "warn", ...), case-insensitive
 * @return The level, or none if the name is not recognized
 */
[[nodiscard]] kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name);

/**
 * @brief Log entry containing all log information
 */
struct LogEntry {
  LogLevel level;
  kj::String timestamp;
  kj::String file;
  int_least32_t line;
  kj::String function;
  kj::String message;
  kj::Maybe<kj::String> payload; // serialized JSON value
  std::chrono::system_clock::time_point time_point;
};

/**
 * @brief Base class for log formatters
 */
class LogFormatter {
public:
  virtual ~LogFormatter() = default;

  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
  [[nodiscard]] virtual kj::StringPtr name() const = 0;
};

/**
 * @brief Human-readable formatter
 *
 * Format: [YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ] [LEVEL] file:line - message payload
 */
class TextFormatter final : public LogFormatter {
public:
  explicit TextFormatter(bool include_function = false, bool use_color = false)
      : include_function_(include_function), use_color_(use_color) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "TextFormatter"_kj;
  }

private:
  bool include_function_;
  bool use_color_;

  [[nodiscard]] kj::String colorize(LogLevel level, kj::StringPtr text) const;
};

/**
 * @brief Structured formatter
 *
 * One JSON object per entry with fields timestamp, level, file, line,
 * function, message and, when present, payload.
 */
class JsonFormatter final : public LogFormatter {
public:
  explicit JsonFormatter(bool pretty = false) : pretty_(pretty) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "JsonFormatter"_kj;
  }

private:
  bool pretty_;
};

/**
 * @brief Base class for log output destinations
 */
class LogOutput {
public:
  virtual ~LogOutput() = default;

  /**
   * @brief Write one formatted entry as a single line
   */
  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;

  virtual void flush() = 0;

  [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Console output. Error and Critical go to stderr, the rest to stdout
 * unless use_stderr is set.
 */
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override {
    return true;
  }

private:
  bool use_stderr_;
};

/**
 * @brief Append-only file output
 *
 * Opens the file in append mode; existing content is never truncated. Each
 * write is flushed so that a record is on disk once write() returns.
 *
 * @throws ResourceException from the constructor if the file cannot be opened
 */
class FileOutput final : public LogOutput {
public:
  explicit FileOutput(kj::StringPtr file_path);
  ~FileOutput() noexcept override;

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

  [[nodiscard]] kj::StringPtr path() const {
    return path_;
  }

  [[nodiscard]] size_t bytes_written() const;

private:
  struct FileOutputState {
    std::ofstream stream;
    size_t bytes_written = 0;
  };

  kj::String path_;
  kj::MutexGuarded<FileOutputState> guarded_;
};

/**
 * @brief Captures formatted lines in memory
 *
 * Useful for embedding applications that forward log lines elsewhere, and for
 * tests.
 */
class MemoryOutput final : public LogOutput {
public:
  MemoryOutput() = default;

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override {}
  [[nodiscard]] bool is_open() const override {
    return true;
  }

  /**
   * @brief Copy of the captured lines, oldest first
   */
  [[nodiscard]] kj::Vector<kj::String> lines() const;
  [[nodiscard]] size_t size() const;
  void clear();

private:
  kj::MutexGuarded<kj::Vector<kj::String>> lines_;
};

/**
 * @brief Writes to multiple output destinations
 */
class MultiOutput final : public LogOutput {
public:
  MultiOutput() = default;

  void add_output(kj::Own<LogOutput> output);

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

private:
  kj::MutexGuarded<kj::Vector<kj::Own<LogOutput>>> outputs_;
};

/**
 * @brief Thread-safe logger
 *
 * Formatting and output happen under one lock, so entries from concurrent
 * callers never interleave. Exceptions thrown by an output propagate to the
 * caller.
 */
class Logger final {
public:
  Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
         kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  ~Logger();

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;

  /**
   * @brief Whether an entry at this level would currently be written
   */
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);
  void set_output(kj::Own<LogOutput> output);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());

  /**
   * @brief Log a message together with a structured JSON payload
   * @param payload_json Serialized JSON value, typically an object
   */
  void log_json(LogLevel level, kj::StringPtr message, kj::StringPtr payload_json,
                const std::source_location& location = std::source_location::current());

  void debug(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void info(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void warn(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void error(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void critical(kj::StringPtr message,
                const std::source_location& location = std::source_location::current());

  void flush();

private:
  struct LoggerState {
    kj::Own<LogFormatter> formatter;
    kj::Own<MultiOutput> multi_output;
    LogLevel level;

    LoggerState(kj::Own<LogFormatter> fmt, kj::Own<LogOutput> out)
        : formatter(kj::mv(fmt)), multi_output(kj::heap<MultiOutput>()), level(LogLevel::Info) {
      multi_output->add_output(kj::mv(out));
    }
  };

  void write_entry(LogLevel level, kj::StringPtr message, kj::Maybe<kj::StringPtr> payload,
                   const std::source_location& location);

  kj::MutexGuarded<LoggerState> guarded_;
};

/**
 * @brief Process-wide logger, created on first use with a text formatter on the console
 */
[[nodiscard]] Logger& global_logger();

} // namespace vigil::core
