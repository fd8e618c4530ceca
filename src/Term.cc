#include "Term.h"
#include "Error.h"
#include "types.h"

#include <algorithm>
#include <cctype>
#include <boost/functional/hash.hpp>

Term Term::iri(const std::string& value)
{
  return Term(kIRI, value);
}

Term Term::blank(const std::string& id)
{
  return Term(kBlank, id);
}

Term Term::literal(const std::string& lexical)
{
  return Term(kLiteral, lexical);
}

Term Term::typedLiteral(const std::string& lexical, const std::string& datatype)
{
  return literal(lexical, datatype, std::string());
}

Term Term::langLiteral(const std::string& lexical, const std::string& language)
{
  return literal(lexical, std::string(), language);
}

Term Term::literal(const std::string& lexical, const std::string& datatype,
                   const std::string& language)
{
  if (!datatype.empty() && !language.empty()) {
    throw ParseError("literal \"" + lexical + "\" has both a datatype and a language tag");
  }

  Term term(kLiteral, lexical);
  // xsd:string is the implicit datatype of plain literals
  if (datatype != kXSDStringURI) {
    term.datatype_ = datatype;
  }
  // language tags compare case-insensitively, keep them lower case
  term.language_ = language;
  std::transform(term.language_.begin(), term.language_.end(), term.language_.begin(),
      [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return term;
}

std::string Term::escape(const std::string& lexical)
{
  std::string result;
  result.reserve(lexical.size());
  for (char c : lexical) {
    switch (c) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:   result += c;
    }
  }
  return result;
}

std::string Term::escapeIRI(const std::string& iri)
{
  static const char hex[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(iri.size());
  for (char c : iri) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}'
        || c == '|' || c == '^' || c == '`' || c == '\\') {
      result += "\\u00";
      result += hex[u >> 4];
      result += hex[u & 0x0F];
    } else {
      result += c;
    }
  }
  return result;
}

std::string Term::toString() const
{
  switch (kind_) {
    case kIRI:
      return "<" + escapeIRI(value_) + ">";
    case kBlank:
      return "_:" + value_;
    case kLiteral:
      break;
  }

  std::string result = "\"" + escape(value_) + "\"";
  if (hasLanguage()) {
    result += "@" + language_;
  } else if (hasDatatype()) {
    result += "^^<" + escapeIRI(datatype_) + ">";
  }
  return result;
}

std::size_t Term::hash() const
{
  std::size_t seed = static_cast<std::size_t>(kind_);
  boost::hash_combine(seed, value_);
  if (kind_ == kLiteral) {
    boost::hash_combine(seed, datatype_);
    boost::hash_combine(seed, language_);
  }
  return seed;
}

bool Term::operator==(const Term& rhs) const
{
  return kind_ == rhs.kind_ && value_ == rhs.value_
      && datatype_ == rhs.datatype_ && language_ == rhs.language_;
}

bool Term::operator<(const Term& rhs) const
{
  if (kind_ != rhs.kind_) {
    return kind_ < rhs.kind_;
  }
  int cmp = value_.compare(rhs.value_);
  if (cmp != 0) {
    return cmp < 0;
  }
  cmp = datatype_.compare(rhs.datatype_);
  if (cmp != 0) {
    return cmp < 0;
  }
  return language_ < rhs.language_;
}

std::ostream& operator<<(std::ostream& outStream, const Term& term)
{
  return outStream << term.toString();
}
