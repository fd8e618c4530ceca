#ifndef TERM_H
#define TERM_H

#include <cstddef> // size_t
#include <ostream>
#include <string>

// An RDF term: IRI, blank node or literal.
// Terms are immutable values compared structurally.
class Term {
public:
  enum Kind {
    kIRI     = 0,
    kBlank   = 1,
    kLiteral = 2
  };

  // an empty IRI, only useful as a placeholder
  Term() : kind_(kIRI) {}

  static Term iri(const std::string& value);
  // id without the "_:" prefix
  static Term blank(const std::string& id);
  static Term literal(const std::string& lexical);
  static Term typedLiteral(const std::string& lexical, const std::string& datatype);
  static Term langLiteral(const std::string& lexical, const std::string& language);
  // Fails if both datatype and language are non-empty.
  static Term literal(const std::string& lexical, const std::string& datatype,
                      const std::string& language);

  Kind kind() const { return kind_; }
  bool isIRI() const { return kind_ == kIRI; }
  bool isBlank() const { return kind_ == kBlank; }
  bool isLiteral() const { return kind_ == kLiteral; }
  // valid subject position (IRI or blank node)
  bool isResource() const { return kind_ != kLiteral; }

  // IRI string, blank node id or lexical form
  const std::string& value() const { return value_; }
  const std::string& datatype() const { return datatype_; }
  const std::string& language() const { return language_; }
  bool hasDatatype() const { return !datatype_.empty(); }
  bool hasLanguage() const { return !language_.empty(); }

  // canonical N-Triples form: <iri>, _:id, "lex", "lex"^^<dt>, "lex"@lang
  std::string toString() const;

  std::size_t hash() const;

  bool operator==(const Term& rhs) const;
  bool operator!=(const Term& rhs) const { return !(*this == rhs); }
  // kind, then value, then datatype, then language
  bool operator<(const Term& rhs) const;

  // escapes a lexical form for use between double quotes
  static std::string escape(const std::string& lexical);
  // escapes characters that may not appear between angle brackets
  static std::string escapeIRI(const std::string& iri);

private:
  Term(Kind kind, const std::string& value) : kind_(kind), value_(value) {}

  Kind kind_;
  std::string value_;
  std::string datatype_;
  std::string language_;
};

std::ostream& operator<<(std::ostream& outStream, const Term& term);

struct TermHasher {
  std::size_t operator()(const Term& term) const { return term.hash(); }
};

#endif
