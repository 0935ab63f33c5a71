#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace vigil::core {

/**
 * @brief Base exception class using KJ exception infrastructure
 *
 * Wraps the message and source location of a failure and maps it onto a
 * kj::Exception type so that code catching kj::Exception and code catching
 * VigilException see consistent information.
 *
 * Usage:
 *   throw VigilException("Something went wrong");
 */
class VigilException {
public:
  explicit VigilException(kj::StringPtr message,
                          kj::Exception::Type type = kj::Exception::Type::FAILED,
                          const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        column_(location.column()), function_(kj::str(location.function_name())), type_(type) {}

  // Allow construction from kj::Exception
  explicit VigilException(const kj::Exception& e)
      : message_(kj::str(e.getDescription())), file_(kj::str(e.getFile())), line_(e.getLine()),
        column_(0), function_(kj::str("")), type_(e.getType()) {}

  virtual ~VigilException() = default;

  VigilException(VigilException&&) = default;
  VigilException& operator=(VigilException&&) = default;

  // Copy operations - need explicit implementation due to kj::String
  VigilException(const VigilException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        column_(other.column_), function_(kj::str(other.function_)), type_(other.type_) {}

  VigilException& operator=(const VigilException& other) {
    if (this != &other) {
      message_ = kj::str(other.message_);
      file_ = kj::str(other.file_);
      line_ = other.line_;
      column_ = other.column_;
      function_ = kj::str(other.function_);
      type_ = other.type_;
    }
    return *this;
  }

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] int column() const noexcept {
    return column_;
  }
  [[nodiscard]] kj::StringPtr function() const noexcept {
    return function_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }

  // For compatibility with code expecting what()
  [[nodiscard]] virtual const char* what() const noexcept {
    return message_.cStr();
  }

  // Name of the concrete exception class, used in diagnostics
  [[nodiscard]] virtual kj::StringPtr kind() const noexcept {
    return "VigilException"_kj;
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(message_));
  }

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  int column_;
  kj::String function_;
  kj::Exception::Type type_;
};

/**
 * @brief Parse error exception (JSON parsing, rule documents, etc.)
 */
class ParseException : public VigilException {
public:
  explicit ParseException(kj::StringPtr message,
                          const std::source_location& location = std::source_location::current())
      : VigilException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "ParseException"_kj;
  }
};

/**
 * @brief Validation error exception (invalid input, constraint violations, etc.)
 */
class ValidationException : public VigilException {
public:
  explicit ValidationException(kj::StringPtr message,
                               const std::source_location& location = std::source_location::current())
      : VigilException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "ValidationException"_kj;
  }
};

/**
 * @brief Resource exception (file not found, unreadable directory, etc.)
 */
class ResourceException : public VigilException {
public:
  explicit ResourceException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : VigilException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "ResourceException"_kj;
  }
};

} // namespace vigil::core
