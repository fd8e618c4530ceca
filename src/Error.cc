#include "Error.h"

#include <sstream>

Error::Error(Kind kind, const std::string& reason)
  : std::runtime_error(format(kind, reason, 0, 0)), kind_(kind), reason_(reason)
{
}

Error::Error(Kind kind, const std::string& reason, std::size_t line, std::size_t column)
  : std::runtime_error(format(kind, reason, line, column)),
    kind_(kind), reason_(reason), line_(line), column_(column)
{
}

Error& Error::withFragment(const std::string& fragment)
{
  fragment_ = fragment;
  return *this;
}

const char* Error::kindName(Kind kind)
{
  switch (kind) {
    case kParseError:      return "parse error";
    case kResolutionError: return "resolution error";
    case kQueryError:      return "query error";
    case kValidationError: return "validation error";
    case kEncodeError:     return "encode error";
  }
  return "error";
}

std::string Error::format(Kind kind, const std::string& reason, std::size_t line, std::size_t column)
{
  std::ostringstream out;
  out << kindName(kind);
  if (line) {
    out << " at line " << line << ", column " << column;
  }
  out << ": " << reason;
  return out.str();
}
