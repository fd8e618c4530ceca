#ifndef ERROR_H
#define ERROR_H

#include <cstddef> // size_t
#include <stdexcept>
#include <string>
#include <boost/variant.hpp>

// Base class of every error the engine reports.
// Inside the library errors are thrown as one of the subclasses below;
// the Engine converts them into Result values at its boundary.
class Error : public std::runtime_error {
public:
  enum Kind {
    kParseError,
    kResolutionError,
    kQueryError,
    kValidationError,
    kEncodeError
  };

  Error(Kind kind, const std::string& reason);
  Error(Kind kind, const std::string& reason, std::size_t line, std::size_t column);

  Kind kind() const { return kind_; }
  const std::string& reason() const { return reason_; }
  // 0 when no position is known
  std::size_t line() const { return line_; }
  std::size_t column() const { return column_; }
  bool hasPosition() const { return line_ != 0; }
  // the offending piece of input (query fragment, IRI, prefix...)
  const std::string& fragment() const { return fragment_; }
  Error& withFragment(const std::string& fragment);

  static const char* kindName(Kind kind);

private:
  Kind kind_;
  std::string reason_;
  std::size_t line_ = 0;
  std::size_t column_ = 0;
  std::string fragment_;

  static std::string format(Kind kind, const std::string& reason, std::size_t line, std::size_t column);
};

struct ParseError : public Error {
  explicit ParseError(const std::string& reason)
    : Error(kParseError, reason) {}
  ParseError(const std::string& reason, std::size_t line, std::size_t column)
    : Error(kParseError, reason, line, column) {}
};

struct ResolutionError : public Error {
  explicit ResolutionError(const std::string& reason)
    : Error(kResolutionError, reason) {}
  ResolutionError(const std::string& reason, std::size_t line, std::size_t column)
    : Error(kResolutionError, reason, line, column) {}
};

struct QueryError : public Error {
  QueryError(const std::string& reason, const std::string& fragment)
    : Error(kQueryError, reason) { withFragment(fragment); }
};

struct ValidationError : public Error {
  explicit ValidationError(const std::string& reason)
    : Error(kValidationError, reason) {}
};

struct EncodeError : public Error {
  explicit EncodeError(const std::string& reason)
    : Error(kEncodeError, reason) {}
};

// Either a value of type T or the Error that prevented computing it.
template <typename T>
class Result {
public:
  Result(const T& value) : value_(value) {}
  Result(const Error& error) : value_(error) {}

  bool ok() const { return value_.which() == 0; }
  explicit operator bool() const { return ok(); }

  // Accessing the value of a failed result rethrows the error.
  const T& value() const {
    if (!ok()) {
      throw boost::get<Error>(value_);
    }
    return boost::get<T>(value_);
  }
  T& value() {
    if (!ok()) {
      throw boost::get<Error>(value_);
    }
    return boost::get<T>(value_);
  }

  const Error& error() const { return boost::get<Error>(value_); }

private:
  boost::variant<T, Error> value_;
};

#endif
