#ifndef TURTLE_LEXER_H
#define TURTLE_LEXER_H

#include <cstddef> // size_t
#include <cstdint>
#include <string>

// Tokenizer for Turtle, N-Triples and the SPARQL subset.
// String, IRI and local name escapes are decoded while scanning, so token
// values are ready to use. Errors are reported as ParseError with the
// position of the offending token.
class TurtleLexer {
public:
  enum Token {
    None,
    Eof,
    IRI,          // <...>, value is the unescaped IRI
    PrefixedName, // prefix:local, see prefix() and local()
    BlankNode,    // _:label, value is the label
    String,       // "..." '...' """...""" '''...'''
    LangTag,      // @tag (also @prefix / @base)
    Integer,
    Decimal,
    Double,
    Variable,     // ?name or $name
    Identifier,   // bare word: a, true, PREFIX, SELECT, ...
    Dot,
    Semicolon,
    Comma,
    LBracket,
    RBracket,
    LParen,
    RParen,
    LCurly,
    RCurly,
    DoubleCaret,
    Star
  };

  // firstLine is the line number of the first input line
  explicit TurtleLexer(const std::string& input, std::size_t firstLine = 1);

  // Get the next token
  Token getNext();
  // Put the last token back, its value stays available
  void unget(Token token) { putBack_ = token; }

  // Value of the current token
  const std::string& value() const { return value_; }
  const std::string& prefix() const { return prefix_; }
  const std::string& local() const { return local_; }
  // Check if the current token is the keyword (case insensitive)
  bool isKeyword(const char* keyword) const;

  // position of the current token
  std::size_t line() const { return tokenLine_; }
  std::size_t column() const { return tokenColumn_; }
  // raw text of the current token, for error messages
  std::string text() const;

  static const char* tokenName(Token token);
  static void appendUTF8(std::string& out, uint32_t codePoint);

private:
  std::string input_;
  std::size_t pos_ = 0;
  std::size_t line_;
  std::size_t lineStart_ = 0;

  Token putBack_ = None;
  std::string value_;
  std::string prefix_;
  std::string local_;
  std::size_t tokenStart_ = 0;
  std::size_t tokenLine_ = 0;
  std::size_t tokenColumn_ = 0;

  bool atEnd() const { return pos_ >= input_.size(); }
  char peek(std::size_t ahead = 0) const;
  char get();
  void skipWhitespaceAndComments();

  Token lexIRI();
  Token lexString(char quote);
  Token lexNumber();
  Token lexName();
  void lexLocalName();
  uint32_t readHex(std::size_t digits);
  void readEscape(std::string& out);

  bool isNameChar(char c) const;
  void fail(const std::string& reason) const;
};

#endif
