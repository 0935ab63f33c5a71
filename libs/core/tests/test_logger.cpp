#include "kj/test.h"
#include "vigil/core/error.h"
#include "vigil/core/id.h"
#include "vigil/core/json.h"
#include "vigil/core/logger.h"

#include <kj/filesystem.h>
#include <kj/string.h>

using namespace vigil::core;

namespace {

LogEntry make_entry(LogLevel level, kj::StringPtr message) {
  return LogEntry{.level = level,
                  .timestamp = kj::str("2024-01-01T12:00:00.000000000Z"),
                  .file = kj::str("test.cpp"),
                  .line = 42,
                  .function = kj::str("test_func"),
                  .message = kj::str(message),
                  .payload = kj::none,
                  .time_point = std::chrono::system_clock::now()};
}

// ============================================================================
// LogLevel Tests
// ============================================================================

KJ_TEST("LogLevel: ToString") {
  KJ_EXPECT(to_string(LogLevel::Trace) == "TRACE");
  KJ_EXPECT(to_string(LogLevel::Info) == "INFO");
  KJ_EXPECT(to_string(LogLevel::Critical) == "CRITICAL");
  KJ_EXPECT(to_string(LogLevel::Off) == "OFF");
}

KJ_TEST("LogLevel: Parse names") {
  KJ_EXPECT(parse_log_level("info"_kj).orDefault(LogLevel::Off) == LogLevel::Info);
  KJ_EXPECT(parse_log_level("WARN"_kj).orDefault(LogLevel::Off) == LogLevel::Warn);
  KJ_EXPECT(parse_log_level("warning"_kj).orDefault(LogLevel::Off) == LogLevel::Warn);
  KJ_EXPECT(parse_log_level("Critical"_kj).orDefault(LogLevel::Off) == LogLevel::Critical);
  KJ_EXPECT(parse_log_level("verbose"_kj) == kj::none);
}

// ============================================================================
// Formatter Tests
// ============================================================================

KJ_TEST("TextFormatter: Format") {
  TextFormatter formatter(false, false);
  auto formatted = formatter.format(make_entry(LogLevel::Info, "Test message"_kj));

  KJ_EXPECT(formatted.contains("[INFO]"));
  KJ_EXPECT(formatted.contains("test.cpp:42"));
  KJ_EXPECT(formatted.contains("Test message"));
  KJ_EXPECT(!formatted.contains("test_func"));
}

KJ_TEST("TextFormatter: Payload follows message") {
  TextFormatter formatter(true, false);
  auto entry = make_entry(LogLevel::Info, "policy_decision"_kj);
  entry.payload = kj::str(R"({"result":"DENY"})");
  auto formatted = formatter.format(entry);

  KJ_EXPECT(formatted.contains("test_func"));
  KJ_EXPECT(formatted.endsWith(R"(policy_decision {"result":"DENY"})"));
}

KJ_TEST("JsonFormatter: Produces one parseable object") {
  JsonFormatter formatter;
  auto entry = make_entry(LogLevel::Warn, "quote \" and newline \n"_kj);
  entry.payload = kj::str(R"({"policy_id":"POL_006_fail_close"})");
  auto formatted = formatter.format(entry);

  KJ_EXPECT(!formatted.contains("\n"));
  auto doc = JsonDocument::parse(formatted);
  auto root = doc.root();
  KJ_EXPECT(root["level"_kj].get_string() == "WARN");
  KJ_EXPECT(root["line"_kj].get_int() == 42);
  KJ_EXPECT(root["message"_kj].get_string() == "quote \" and newline \n");
  KJ_EXPECT(root["payload"_kj]["policy_id"_kj].get_string() == "POL_006_fail_close");
}

// ============================================================================
// Logger Tests
// ============================================================================

KJ_TEST("Logger: Level filtering") {
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  Logger logger(kj::heap<TextFormatter>(), kj::mv(output));
  logger.set_level(LogLevel::Warn);

  logger.debug("hidden");
  logger.info("hidden too");
  logger.warn("visible");
  logger.error("also visible");

  auto captured = lines.lines();
  KJ_ASSERT(captured.size() == 2);
  KJ_EXPECT(captured[0].contains("visible"));
  KJ_EXPECT(captured[1].contains("[ERROR]"));
  KJ_EXPECT(logger.enabled(LogLevel::Error));
  KJ_EXPECT(!logger.enabled(LogLevel::Info));
}

KJ_TEST("Logger: Off disables output") {
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  Logger logger(kj::heap<TextFormatter>(), kj::mv(output));
  logger.set_level(LogLevel::Off);
  logger.critical("nothing");
  KJ_EXPECT(lines.size() == 0);
}

KJ_TEST("Logger: Structured entries carry the payload") {
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  Logger logger(kj::heap<JsonFormatter>(), kj::mv(output));

  logger.log_json(LogLevel::Info, "policy_decision"_kj, R"({"result":"ALLOW"})"_kj);

  auto captured = lines.lines();
  KJ_ASSERT(captured.size() == 1);
  auto doc = JsonDocument::parse(captured[0]);
  KJ_EXPECT(doc.root()["message"_kj].get_string() == "policy_decision");
  KJ_EXPECT(doc.root()["payload"_kj]["result"_kj].get_string() == "ALLOW");
  KJ_EXPECT(doc.root()["file"_kj].get_string() == "test_logger.cpp");
}

KJ_TEST("Logger: Multiple outputs receive every entry") {
  auto first = kj::heap<MemoryOutput>();
  auto second = kj::heap<MemoryOutput>();
  auto& first_ref = *first;
  auto& second_ref = *second;
  Logger logger(kj::heap<TextFormatter>(), kj::mv(first));
  logger.add_output(kj::mv(second));

  logger.info("fan out");
  KJ_EXPECT(first_ref.size() == 1);
  KJ_EXPECT(second_ref.size() == 1);
}

class ThrowingOutput final : public LogOutput {
public:
  void write(kj::StringPtr, const LogEntry&) override {
    throw ResourceException("disk full");
  }
  void flush() override {}
  bool is_open() const override {
    return true;
  }
};

KJ_TEST("Logger: Output failures propagate to the caller") {
  Logger logger(kj::heap<TextFormatter>(), kj::heap<ThrowingOutput>());
  bool thrown = false;
  try {
    logger.info("lost");
  } catch (const ResourceException& e) {
    thrown = true;
    KJ_EXPECT(e.message() == "disk full");
  }
  KJ_EXPECT(thrown);

  // The logger stays usable after a failed write
  logger.set_output(kj::heap<MemoryOutput>());
  logger.info("recovered");
}

KJ_TEST("FileOutput: Appends lines without truncating") {
  auto path = kj::str("/tmp/vigil_logger_test_", generate_uuid_v4(), ".log");
  {
    Logger logger(kj::heap<TextFormatter>(), kj::heap<FileOutput>(path));
    logger.info("first");
  }
  {
    auto file_output = kj::heap<FileOutput>(path);
    auto& file_ref = *file_output;
    Logger logger(kj::heap<TextFormatter>(), kj::mv(file_output));
    logger.info("second");
    KJ_EXPECT(file_ref.bytes_written() > 0);
    KJ_EXPECT(file_ref.is_open());
  }

  auto fs = kj::newDiskFilesystem();
  auto file_path = kj::Path::parse(path.slice(1));
  auto text = fs->getRoot().openFile(file_path)->readAllText();
  KJ_EXPECT(text.contains("first"));
  KJ_EXPECT(text.contains("second"));
  fs->getRoot().remove(file_path);
}

KJ_TEST("FileOutput: Unopenable path raises ResourceException") {
  bool thrown = false;
  try {
    FileOutput output("/nonexistent/vigil/decisions.log"_kj);
  } catch (const ResourceException&) {
    thrown = true;
  }
  KJ_EXPECT(thrown);
}

} // namespace
