#include "TurtleLexer.h"
#include "Error.h"

#include <cctype>
#include <cstring>
#include <strings.h>

TurtleLexer::TurtleLexer(const std::string& input, std::size_t firstLine)
  : input_(input), line_(firstLine)
{
}

const char* TurtleLexer::tokenName(Token token)
{
  switch (token) {
    case None:         return "nothing";
    case Eof:          return "end of input";
    case IRI:          return "IRI";
    case PrefixedName: return "prefixed name";
    case BlankNode:    return "blank node";
    case String:       return "string";
    case LangTag:      return "language tag";
    case Integer:      return "integer";
    case Decimal:      return "decimal";
    case Double:       return "double";
    case Variable:     return "variable";
    case Identifier:   return "identifier";
    case Dot:          return "'.'";
    case Semicolon:    return "';'";
    case Comma:        return "','";
    case LBracket:     return "'['";
    case RBracket:     return "']'";
    case LParen:       return "'('";
    case RParen:       return "')'";
    case LCurly:       return "'{'";
    case RCurly:       return "'}'";
    case DoubleCaret:  return "'^^'";
    case Star:         return "'*'";
  }
  return "token";
}

void TurtleLexer::appendUTF8(std::string& out, uint32_t cp)
{
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool TurtleLexer::isKeyword(const char* keyword) const
{
  return ::strcasecmp(value_.c_str(), keyword) == 0;
}

std::string TurtleLexer::text() const
{
  std::size_t end = pos_ > tokenStart_ ? pos_ : tokenStart_ + 1;
  if (end > input_.size()) {
    end = input_.size();
  }
  return input_.substr(tokenStart_, end - tokenStart_);
}

void TurtleLexer::fail(const std::string& reason) const
{
  throw ParseError(reason, tokenLine_, tokenColumn_);
}

char TurtleLexer::peek(std::size_t ahead) const
{
  return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
}

char TurtleLexer::get()
{
  char c = input_[pos_++];
  if (c == '\n') {
    ++line_;
    lineStart_ = pos_;
  }
  return c;
}

void TurtleLexer::skipWhitespaceAndComments()
{
  while (!atEnd()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
      get();
    } else if (c == '#') {
      while (!atEnd() && peek() != '\n') {
        get();
      }
    } else {
      break;
    }
  }
}

bool TurtleLexer::isNameChar(char c) const
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'
      || (static_cast<unsigned char>(c) & 0x80);
}

TurtleLexer::Token TurtleLexer::getNext()
{
  // Do we have a token already?
  if (putBack_ != None) {
    Token result = putBack_;
    putBack_ = None;
    return result;
  }

  skipWhitespaceAndComments();
  value_.clear();
  prefix_.clear();
  local_.clear();
  tokenStart_ = pos_;
  tokenLine_ = line_;
  tokenColumn_ = pos_ - lineStart_ + 1;

  if (atEnd()) {
    return Eof;
  }

  char c = peek();
  switch (c) {
    case '.':
      if (std::isdigit(static_cast<unsigned char>(peek(1)))) {
        return lexNumber();
      }
      get();
      return Dot;
    case ';': get(); return Semicolon;
    case ',': get(); return Comma;
    case '[': get(); return LBracket;
    case ']': get(); return RBracket;
    case '(': get(); return LParen;
    case ')': get(); return RParen;
    case '{': get(); return LCurly;
    case '}': get(); return RCurly;
    case '*': get(); return Star;
    case '^':
      get();
      if (peek() != '^') {
        fail("expected '^^'");
      }
      get();
      return DoubleCaret;
    case '<':
      return lexIRI();
    case '"':
    case '\'':
      return lexString(c);
    case '@':
      get();
      while (!atEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '-')) {
        value_ += get();
      }
      if (value_.empty()) {
        fail("empty language tag");
      }
      return LangTag;
    case '?':
    case '$':
      get();
      while (!atEnd() && isNameChar(peek()) && peek() != '-') {
        value_ += get();
      }
      if (value_.empty()) {
        fail("empty variable name");
      }
      return Variable;
    case '+':
    case '-':
      return lexNumber();
    case '_':
      if (peek(1) == ':') {
        get();
        get();
        while (!atEnd() && (isNameChar(peek()) || (peek() == '.' && isNameChar(peek(1))))) {
          value_ += get();
        }
        if (value_.empty()) {
          fail("empty blank node label");
        }
        return BlankNode;
      }
      return lexName();
    default:
      if (std::isdigit(static_cast<unsigned char>(c))) {
        return lexNumber();
      }
      if (c == ':' || isNameChar(c)) {
        return lexName();
      }
  }

  get();
  fail(std::string("unexpected character '") + c + "'");
  return None;
}

TurtleLexer::Token TurtleLexer::lexIRI()
{
  get(); // '<'
  while (true) {
    if (atEnd()) {
      fail("unterminated IRI");
    }
    char c = get();
    if (c == '>') {
      break;
    }
    if (c == '\\') {
      char e = atEnd() ? '\0' : get();
      if (e == 'u') {
        appendUTF8(value_, readHex(4));
      } else if (e == 'U') {
        appendUTF8(value_, readHex(8));
      } else {
        fail("invalid escape in IRI");
      }
      continue;
    }
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '<' || c == '"'
        || c == '{' || c == '}' || c == '|' || c == '^' || c == '`') {
      fail(std::string("invalid character '") + c + "' in IRI");
    }
    value_ += c;
  }
  return IRI;
}

uint32_t TurtleLexer::readHex(std::size_t digits)
{
  uint32_t result = 0;
  for (std::size_t i(0); i != digits; ++i) {
    if (atEnd() || !std::isxdigit(static_cast<unsigned char>(peek()))) {
      fail("invalid unicode escape");
    }
    char c = get();
    result <<= 4;
    if (c >= '0' && c <= '9') {
      result |= static_cast<uint32_t>(c - '0');
    } else {
      result |= static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }
  }
  if (result > 0x10FFFF) {
    fail("code point out of range");
  }
  return result;
}

void TurtleLexer::readEscape(std::string& out)
{
  if (atEnd()) {
    fail("unterminated escape sequence");
  }
  char e = get();
  switch (e) {
    case 't':  out += '\t'; break;
    case 'b':  out += '\b'; break;
    case 'n':  out += '\n'; break;
    case 'r':  out += '\r'; break;
    case 'f':  out += '\f'; break;
    case '"':  out += '"'; break;
    case '\'': out += '\''; break;
    case '\\': out += '\\'; break;
    case 'u':  appendUTF8(out, readHex(4)); break;
    case 'U':  appendUTF8(out, readHex(8)); break;
    default:
      fail(std::string("invalid escape '\\") + e + "'");
  }
}

TurtleLexer::Token TurtleLexer::lexString(char quote)
{
  bool isLong = peek(1) == quote && peek(2) == quote;
  get();
  if (isLong) {
    get();
    get();
  }

  while (true) {
    if (atEnd()) {
      fail("unterminated string");
    }
    char c = peek();
    if (c == '\\') {
      get();
      readEscape(value_);
      continue;
    }
    if (c == quote) {
      if (!isLong) {
        get();
        break;
      }
      if (peek(1) == quote && peek(2) == quote) {
        // a long string may end with up to two more quotes of its own
        while (peek(3) == quote) {
          value_ += get();
        }
        get();
        get();
        get();
        break;
      }
    } else if (!isLong && (c == '\n' || c == '\r')) {
      fail("line break in string");
    }
    value_ += get();
  }
  return String;
}

TurtleLexer::Token TurtleLexer::lexNumber()
{
  Token token = Integer;
  if (peek() == '+' || peek() == '-') {
    value_ += get();
  }
  while (std::isdigit(static_cast<unsigned char>(peek()))) {
    value_ += get();
  }
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
    token = Decimal;
    value_ += get();
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      value_ += get();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    std::size_t ahead = (peek(1) == '+' || peek(1) == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(ahead)))) {
      token = Double;
      for (std::size_t i(0); i != ahead; ++i) {
        value_ += get();
      }
      while (std::isdigit(static_cast<unsigned char>(peek()))) {
        value_ += get();
      }
    }
  }
  if (value_.empty() || value_ == "+" || value_ == "-") {
    fail("malformed number");
  }
  return token;
}

TurtleLexer::Token TurtleLexer::lexName()
{
  while (!atEnd() && (isNameChar(peek()) || (peek() == '.' && isNameChar(peek(1))))) {
    value_ += get();
  }
  if (peek() != ':') {
    return Identifier;
  }

  get(); // ':'
  prefix_ = value_;
  lexLocalName();
  value_ = prefix_ + ":" + local_;
  return PrefixedName;
}

void TurtleLexer::lexLocalName()
{
  while (!atEnd()) {
    char c = peek();
    if (isNameChar(c) || c == ':') {
      local_ += get();
    } else if (c == '.' && (isNameChar(peek(1)) || peek(1) == ':' || peek(1) == '%')) {
      // a trailing dot ends the statement
      local_ += get();
    } else if (c == '%' && std::isxdigit(static_cast<unsigned char>(peek(1)))
        && std::isxdigit(static_cast<unsigned char>(peek(2)))) {
      local_ += get();
      local_ += get();
      local_ += get();
    } else if (c == '\\' && pos_ + 1 < input_.size()
        && std::strchr("_~.-!$&'()*+,;=/?#@%", peek(1))) {
      get();
      local_ += get();
    } else {
      break;
    }
  }
}
