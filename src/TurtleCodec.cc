#include "TurtleCodec.h"
#include "TurtleLexer.h"
#include "types.h"

#include <set>
#include <sstream>

namespace {

// Recursive descent parser for Turtle documents
class TurtleParser {
public:
  TurtleParser(const std::string& text, const DecodeOptions& options)
    : lexer_(text), namespaces_(options.namespaces), base_(options.baseIRI),
      blanks_(options.blankPrefix) {}

  DecodeResult parse();

private:
  typedef TurtleLexer::Token Token;

  TurtleLexer lexer_;
  NamespaceTable namespaces_;
  NamespaceTable declared_;
  std::string base_;
  BlankNodeLabeler blanks_;
  TripleVector triples_;

  void parseDirective(bool isPrefix, bool sparqlStyle);
  void parseTriples(Token token);
  void parsePredicateObjectList(const Term& subject);
  void parseObjectList(const Term& subject, const Term& predicate);
  Term parseSubject(Token token);
  Term parsePredicate(Token token);
  Term parseObject(Token token);
  Term parseBlankNodePropertyList();
  Term parseCollection();
  Term parseLiteral();

  Term resolveIRI(const std::string& iri);
  Term resolvePrefixedName();
  void expect(Token expected);
  void fail(const std::string& reason);
  void emit(const Term& s, const Term& p, const Term& o) { triples_.push_back(Triple(s, p, o)); }
};

DecodeResult TurtleParser::parse()
{
  while (true) {
    Token token = lexer_.getNext();
    if (token == TurtleLexer::Eof) {
      break;
    }
    if (token == TurtleLexer::LangTag && (lexer_.value() == "prefix" || lexer_.value() == "base")) {
      parseDirective(lexer_.value() == "prefix", false);
    } else if (token == TurtleLexer::Identifier && (lexer_.isKeyword("PREFIX") || lexer_.isKeyword("BASE"))) {
      parseDirective(lexer_.isKeyword("PREFIX"), true);
    } else {
      parseTriples(token);
    }
  }

  DecodeResult result;
  result.triples.swap(triples_);
  result.namespaces = declared_;
  return result;
}

void TurtleParser::parseDirective(bool isPrefix, bool sparqlStyle)
{
  if (isPrefix) {
    if (lexer_.getNext() != TurtleLexer::PrefixedName || !lexer_.local().empty()) {
      fail("expected a prefix declaration like 'ex:'");
    }
    std::string prefix = lexer_.prefix();
    if (lexer_.getNext() != TurtleLexer::IRI) {
      fail("expected namespace IRI for prefix '" + prefix + "'");
    }
    std::string iri = resolveIRI(lexer_.value()).value();
    namespaces_.add(prefix, iri);
    declared_.add(prefix, iri);
  } else {
    if (lexer_.getNext() != TurtleLexer::IRI) {
      fail("expected base IRI");
    }
    base_ = resolveIRI(lexer_.value()).value();
  }

  if (!sparqlStyle) {
    expect(TurtleLexer::Dot);
  }
}

void TurtleParser::parseTriples(Token token)
{
  if (token == TurtleLexer::LBracket) {
    // [ ... ] may stand alone as a statement
    Term subject = parseBlankNodePropertyList();
    Token next = lexer_.getNext();
    if (next != TurtleLexer::Dot) {
      lexer_.unget(next);
      parsePredicateObjectList(subject);
      expect(TurtleLexer::Dot);
    }
    return;
  }

  Term subject = parseSubject(token);
  parsePredicateObjectList(subject);
  expect(TurtleLexer::Dot);
}

void TurtleParser::parsePredicateObjectList(const Term& subject)
{
  Term predicate = parsePredicate(lexer_.getNext());
  parseObjectList(subject, predicate);

  while (true) {
    Token token = lexer_.getNext();
    if (token != TurtleLexer::Semicolon) {
      lexer_.unget(token);
      return;
    }
    // repeated or trailing semicolons are allowed
    token = lexer_.getNext();
    while (token == TurtleLexer::Semicolon) {
      token = lexer_.getNext();
    }
    if (token == TurtleLexer::Dot || token == TurtleLexer::RBracket || token == TurtleLexer::Eof) {
      lexer_.unget(token);
      return;
    }
    predicate = parsePredicate(token);
    parseObjectList(subject, predicate);
  }
}

void TurtleParser::parseObjectList(const Term& subject, const Term& predicate)
{
  while (true) {
    Term object = parseObject(lexer_.getNext());
    emit(subject, predicate, object);
    Token token = lexer_.getNext();
    if (token != TurtleLexer::Comma) {
      lexer_.unget(token);
      return;
    }
  }
}

Term TurtleParser::parseSubject(Token token)
{
  switch (token) {
    case TurtleLexer::IRI:          return resolveIRI(lexer_.value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::BlankNode:    return blanks_.labelled(lexer_.value());
    case TurtleLexer::LParen:       return parseCollection();
    default:
      fail(std::string("expected subject, found ") + TurtleLexer::tokenName(token));
  }
  return Term();
}

Term TurtleParser::parsePredicate(Token token)
{
  switch (token) {
    case TurtleLexer::IRI:          return resolveIRI(lexer_.value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::Identifier:
      if (lexer_.value() == "a") {
        return Term::iri(kTypeURI);
      }
      break;
    default:
      break;
  }
  fail(std::string("expected predicate, found ") + TurtleLexer::tokenName(token));
  return Term();
}

Term TurtleParser::parseObject(Token token)
{
  switch (token) {
    case TurtleLexer::IRI:          return resolveIRI(lexer_.value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::BlankNode:    return blanks_.labelled(lexer_.value());
    case TurtleLexer::LBracket:     return parseBlankNodePropertyList();
    case TurtleLexer::LParen:       return parseCollection();
    case TurtleLexer::String:       return parseLiteral();
    case TurtleLexer::Integer:      return Term::typedLiteral(lexer_.value(), kXSDIntegerURI);
    case TurtleLexer::Decimal:      return Term::typedLiteral(lexer_.value(), kXSDDecimalURI);
    case TurtleLexer::Double:       return Term::typedLiteral(lexer_.value(), kXSDDoubleURI);
    case TurtleLexer::Identifier:
      if (lexer_.value() == "true" || lexer_.value() == "false") {
        return Term::typedLiteral(lexer_.value(), kXSDBooleanURI);
      }
      break;
    default:
      break;
  }
  fail(std::string("expected object, found ") + TurtleLexer::tokenName(token));
  return Term();
}

// called after '['
Term TurtleParser::parseBlankNodePropertyList()
{
  Term node = blanks_.fresh();
  Token token = lexer_.getNext();
  if (token == TurtleLexer::RBracket) {
    return node;
  }
  lexer_.unget(token);
  parsePredicateObjectList(node);
  expect(TurtleLexer::RBracket);
  return node;
}

// called after '('
Term TurtleParser::parseCollection()
{
  const Term first = Term::iri(kFirstURI);
  const Term rest = Term::iri(kRestURI);
  Term head = Term::iri(kNilURI);
  Term current;

  while (true) {
    Token token = lexer_.getNext();
    if (token == TurtleLexer::RParen) {
      break;
    }
    if (token == TurtleLexer::Eof) {
      fail("unterminated collection");
    }
    Term cell = blanks_.fresh();
    if (head.isIRI()) {
      head = cell;
    } else {
      emit(current, rest, cell);
    }
    current = cell;
    emit(cell, first, parseObject(token));
  }

  if (!head.isIRI()) {
    emit(current, rest, Term::iri(kNilURI));
  }
  return head;
}

// called with the current token being a string
Term TurtleParser::parseLiteral()
{
  std::string lexical = lexer_.value();
  Token token = lexer_.getNext();
  if (token == TurtleLexer::LangTag) {
    return Term::langLiteral(lexical, lexer_.value());
  }
  if (token == TurtleLexer::DoubleCaret) {
    token = lexer_.getNext();
    Term datatype;
    if (token == TurtleLexer::IRI) {
      datatype = resolveIRI(lexer_.value());
    } else if (token == TurtleLexer::PrefixedName) {
      datatype = resolvePrefixedName();
    } else {
      fail("expected datatype IRI after '^^'");
    }
    return Term::typedLiteral(lexical, datatype.value());
  }
  lexer_.unget(token);
  return Term::literal(lexical);
}

Term TurtleParser::resolveIRI(const std::string& iri)
{
  try {
    if (NamespaceTable::isAbsolute(iri)) {
      return Term::iri(iri);
    }
    return Term::iri(NamespaceTable::resolveRelative(base_, iri));
  } catch (const ResolutionError& e) {
    throw ResolutionError(e.reason(), lexer_.line(), lexer_.column());
  }
}

Term TurtleParser::resolvePrefixedName()
{
  try {
    return Term::iri(namespaces_.resolve(lexer_.prefix(), lexer_.local()));
  } catch (const ResolutionError& e) {
    throw ResolutionError(e.reason(), lexer_.line(), lexer_.column());
  }
}

void TurtleParser::expect(Token expected)
{
  Token token = lexer_.getNext();
  if (token != expected) {
    fail(std::string("expected ") + TurtleLexer::tokenName(expected)
        + ", found " + TurtleLexer::tokenName(token));
  }
}

void TurtleParser::fail(const std::string& reason)
{
  throw ParseError(reason, lexer_.line(), lexer_.column());
}

////////////////////////////////////////////////////////////////////////////////

class TurtleWriter {
public:
  explicit TurtleWriter(const NamespaceTable& namespaces) : namespaces_(namespaces) {}
  std::string write(const TripleVector& triples);

private:
  const NamespaceTable& namespaces_;
  std::set<std::string> used_;

  std::string formatIRI(const std::string& iri);
  std::string formatTerm(const Term& term);
};

std::string TurtleWriter::formatIRI(const std::string& iri)
{
  std::string prefix, local;
  if (namespaces_.shorten(iri, prefix, local)) {
    used_.insert(prefix);
    return prefix + ":" + local;
  }
  return "<" + Term::escapeIRI(iri) + ">";
}

std::string TurtleWriter::formatTerm(const Term& term)
{
  switch (term.kind()) {
    case Term::kIRI:
      return formatIRI(term.value());
    case Term::kBlank:
      return "_:" + term.value();
    case Term::kLiteral:
      break;
  }

  std::string result = "\"" + Term::escape(term.value()) + "\"";
  if (term.hasLanguage()) {
    result += "@" + term.language();
  } else if (term.hasDatatype()) {
    result += "^^" + formatIRI(term.datatype());
  }
  return result;
}

std::string TurtleWriter::write(const TripleVector& triples)
{
  std::ostringstream body;
  for (std::size_t i(0); i != triples.size(); ++i) {
    const Triple& t = triples[i];
    bool sameSubject = i && triples[i - 1].subject == t.subject;
    bool samePredicate = sameSubject && triples[i - 1].predicate == t.predicate;

    if (samePredicate) {
      body << " ,\n        " << formatTerm(t.object);
      continue;
    }
    if (sameSubject) {
      body << " ;\n    ";
    } else {
      if (i) {
        body << " .\n\n";
      }
      body << formatTerm(t.subject) << "\n    ";
    }
    if (t.predicate.value() == kTypeURI) {
      body << "a";
    } else {
      body << formatTerm(t.predicate);
    }
    body << " " << formatTerm(t.object);
  }
  if (!triples.empty()) {
    body << " .\n";
  }

  std::ostringstream out;
  for (auto it(namespaces_.begin()); it != namespaces_.end(); ++it) {
    if (used_.count(it->first)) {
      out << "@prefix " << it->first << ": <" << Term::escapeIRI(it->second) << "> .\n";
    }
  }
  if (!used_.empty()) {
    out << "\n";
  }
  out << body.str();
  return out.str();
}

} // namespace

DecodeResult TurtleDecoder::decode(const std::string& text, const DecodeOptions& options)
{
  TurtleParser parser(text, options);
  return parser.parse();
}

std::string TurtleEncoder::encode(const TripleVector& triples, const EncodeOptions& options)
{
  TurtleWriter writer(options.namespaces);
  return writer.write(triples);
}
