#include "QueryParser.h"
#include "Error.h"
#include "types.h"

#include <cctype>
#include <cstdlib>

QueryParser::QueryParser(const NamespaceTable& namespaces)
  : initial_(namespaces)
{
}

Query QueryParser::parse(const std::string& text)
{
  TurtleLexer lexer(text);
  lexer_ = &lexer;
  namespaces_ = initial_;
  base_.clear();

  Query query;
  try {
    parsePrologue();

    Token token = next();
    if (token != TurtleLexer::Identifier) {
      fail("expected SELECT, ASK, CONSTRUCT or DESCRIBE");
    }
    if (lexer.isKeyword("SELECT")) {
      query.form = Query::kSelect;
      parseSelectClause(query);
      parseWhere(query);
    } else if (lexer.isKeyword("ASK")) {
      query.form = Query::kAsk;
      parseWhere(query);
    } else if (lexer.isKeyword("CONSTRUCT")) {
      query.form = Query::kConstruct;
      expect(TurtleLexer::LCurly, "CONSTRUCT template");
      parseGroup(query.construct);
      parseWhere(query);
    } else if (lexer.isKeyword("DESCRIBE")) {
      query.form = Query::kDescribe;
      parseDescribeTarget(query);
      token = next();
      lexer.unget(token);
      if (token == TurtleLexer::LCurly || (token == TurtleLexer::Identifier && lexer.isKeyword("WHERE"))) {
        parseWhere(query);
      }
    } else {
      fail("unsupported query form '" + lexer.value() + "'");
    }

    parseModifiers(query);
    if (next() != TurtleLexer::Eof) {
      fail("unexpected input after the end of the query");
    }
  } catch (const ParseError& e) {
    // lexical errors
    lexer_ = nullptr;
    throw QueryError(e.reason(), lexer.text());
  } catch (const ResolutionError& e) {
    lexer_ = nullptr;
    throw QueryError(e.reason(), lexer.text());
  } catch (...) {
    lexer_ = nullptr;
    throw;
  }

  lexer_ = nullptr;
  return query;
}

void QueryParser::parsePrologue()
{
  while (true) {
    Token token = next();
    if (token != TurtleLexer::Identifier || !(lexer_->isKeyword("PREFIX") || lexer_->isKeyword("BASE"))) {
      lexer_->unget(token);
      return;
    }
    if (lexer_->isKeyword("PREFIX")) {
      if (next() != TurtleLexer::PrefixedName || !lexer_->local().empty()) {
        fail("expected a prefix like 'ex:' after PREFIX");
      }
      std::string prefix = lexer_->prefix();
      if (next() != TurtleLexer::IRI) {
        fail("expected namespace IRI for prefix '" + prefix + ":'");
      }
      namespaces_.add(prefix, resolveIRI(lexer_->value()).value());
    } else {
      if (next() != TurtleLexer::IRI) {
        fail("expected IRI after BASE");
      }
      base_ = resolveIRI(lexer_->value()).value();
    }
  }
}

void QueryParser::parseSelectClause(Query& query)
{
  Token token = next();
  if (token == TurtleLexer::Identifier && (lexer_->isKeyword("DISTINCT") || lexer_->isKeyword("REDUCED"))) {
    query.distinct = true;
    token = next();
  }

  if (token == TurtleLexer::Star) {
    query.selectAll = true;
    return;
  }

  while (token == TurtleLexer::Variable) {
    query.variables.push_back(lexer_->value());
    token = next();
  }
  lexer_->unget(token);

  if (query.variables.empty()) {
    fail("expected '*' or variables after SELECT");
  }
}

void QueryParser::parseDescribeTarget(Query& query)
{
  Token token = next();
  switch (token) {
    case TurtleLexer::Variable:
      query.describe = PatternTerm::variable(lexer_->value());
      break;
    case TurtleLexer::IRI:
      query.describe = resolveIRI(lexer_->value());
      break;
    case TurtleLexer::PrefixedName:
      query.describe = resolvePrefixedName();
      break;
    default:
      fail("expected IRI, prefixed name or variable after DESCRIBE");
  }
}

void QueryParser::parseWhere(Query& query)
{
  Token token = next();
  if (token == TurtleLexer::Identifier && lexer_->isKeyword("WHERE")) {
    token = next();
  }
  if (token != TurtleLexer::LCurly) {
    fail("expected '{' to open the WHERE clause");
  }
  parseGroup(query.where);
}

// called after '{', consumes the closing '}'
void QueryParser::parseGroup(PatternVector& patterns)
{
  while (true) {
    Token token = next();
    if (token == TurtleLexer::RCurly) {
      return;
    }
    if (token == TurtleLexer::Eof) {
      fail("missing '}'");
    }
    if (isUnsupportedKeyword(token)) {
      fail("'" + lexer_->value() + "' is not supported");
    }

    parseTriplesSameSubject(token, patterns);

    token = next();
    if (token == TurtleLexer::RCurly) {
      return;
    }
    if (isUnsupportedKeyword(token)) {
      fail("'" + lexer_->value() + "' is not supported");
    }
    if (token != TurtleLexer::Dot) {
      fail("expected '.' or '}' after triple pattern");
    }
  }
}

void QueryParser::parseTriplesSameSubject(Token token, PatternVector& patterns)
{
  PatternTerm subject = parseSubject(token);

  while (true) {
    PatternTerm predicate = parsePredicate(next());
    while (true) {
      patterns.push_back(TriplePattern(subject, predicate, parseObject(next())));
      token = next();
      if (token != TurtleLexer::Comma) {
        break;
      }
    }
    if (token != TurtleLexer::Semicolon) {
      lexer_->unget(token);
      return;
    }
    // a trailing ';' may end the list
    token = next();
    lexer_->unget(token);
    if (token == TurtleLexer::Dot || token == TurtleLexer::RCurly) {
      return;
    }
  }
}

void QueryParser::parseModifiers(Query& query)
{
  bool seenLimit(false), seenOffset(false);
  while (true) {
    Token token = next();
    if (token != TurtleLexer::Identifier) {
      lexer_->unget(token);
      return;
    }
    if (lexer_->isKeyword("LIMIT") && !seenLimit) {
      query.limit = parseCount("LIMIT");
      seenLimit = true;
    } else if (lexer_->isKeyword("OFFSET") && !seenOffset) {
      query.offset = parseCount("OFFSET");
      seenOffset = true;
    } else if (lexer_->isKeyword("ORDER") || lexer_->isKeyword("GROUP") || lexer_->isKeyword("HAVING")) {
      fail("'" + lexer_->value() + "' is not supported");
    } else {
      fail("unexpected '" + lexer_->value() + "'");
    }
  }
}

std::size_t QueryParser::parseCount(const char* keyword)
{
  Token token = next();
  const std::string& value = lexer_->value();
  if (token != TurtleLexer::Integer || value.empty() || value[0] == '-') {
    fail(std::string(keyword) + " expects a non-negative integer");
  }
  std::size_t start = value[0] == '+' ? 1 : 0;
  return static_cast<std::size_t>(std::strtoull(value.c_str() + start, nullptr, 10));
}

////////////////////////////////////////////////////////////////////////////////

PatternTerm QueryParser::parseSubject(Token token)
{
  switch (token) {
    case TurtleLexer::Variable:     return PatternTerm::variable(lexer_->value());
    case TurtleLexer::IRI:          return resolveIRI(lexer_->value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::BlankNode:
    case TurtleLexer::LBracket:
      fail("blank nodes are not supported in query patterns");
      break;
    default:
      break;
  }
  fail(std::string("expected subject, found ") + TurtleLexer::tokenName(token));
  return PatternTerm();
}

PatternTerm QueryParser::parsePredicate(Token token)
{
  switch (token) {
    case TurtleLexer::Variable:     return PatternTerm::variable(lexer_->value());
    case TurtleLexer::IRI:          return resolveIRI(lexer_->value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::Identifier:
      if (lexer_->value() == "a") {
        return Term::iri(kTypeURI);
      }
      break;
    default:
      break;
  }
  fail(std::string("expected predicate, found ") + TurtleLexer::tokenName(token));
  return PatternTerm();
}

PatternTerm QueryParser::parseObject(Token token)
{
  switch (token) {
    case TurtleLexer::Variable:     return PatternTerm::variable(lexer_->value());
    case TurtleLexer::IRI:          return resolveIRI(lexer_->value());
    case TurtleLexer::PrefixedName: return resolvePrefixedName();
    case TurtleLexer::String:       return parseLiteral();
    case TurtleLexer::Integer:      return Term::typedLiteral(lexer_->value(), kXSDIntegerURI);
    case TurtleLexer::Decimal:      return Term::typedLiteral(lexer_->value(), kXSDDecimalURI);
    case TurtleLexer::Double:       return Term::typedLiteral(lexer_->value(), kXSDDoubleURI);
    case TurtleLexer::Identifier:
      if (lexer_->value() == "true" || lexer_->value() == "false") {
        return Term::typedLiteral(lexer_->value(), kXSDBooleanURI);
      }
      break;
    case TurtleLexer::BlankNode:
    case TurtleLexer::LBracket:
      fail("blank nodes are not supported in query patterns");
      break;
    default:
      break;
  }
  fail(std::string("expected object, found ") + TurtleLexer::tokenName(token));
  return PatternTerm();
}

// called with the current token being a string
Term QueryParser::parseLiteral()
{
  std::string lexical = lexer_->value();
  Token token = next();
  if (token == TurtleLexer::LangTag) {
    return Term::langLiteral(lexical, lexer_->value());
  }
  if (token == TurtleLexer::DoubleCaret) {
    token = next();
    Term datatype;
    if (token == TurtleLexer::IRI) {
      datatype = resolveIRI(lexer_->value());
    } else if (token == TurtleLexer::PrefixedName) {
      datatype = resolvePrefixedName();
    } else {
      fail("expected datatype IRI after '^^'");
    }
    return Term::typedLiteral(lexical, datatype.value());
  }
  lexer_->unget(token);
  return Term::literal(lexical);
}

Term QueryParser::resolveIRI(const std::string& iri)
{
  if (NamespaceTable::isAbsolute(iri)) {
    return Term::iri(iri);
  }
  if (base_.empty()) {
    fail("relative IRI <" + iri + "> without BASE");
  }
  return Term::iri(NamespaceTable::resolveRelative(base_, iri));
}

Term QueryParser::resolvePrefixedName()
{
  if (!namespaces_.has(lexer_->prefix())) {
    fail("unknown prefix '" + lexer_->prefix() + ":'");
  }
  return Term::iri(namespaces_.resolve(lexer_->prefix(), lexer_->local()));
}

////////////////////////////////////////////////////////////////////////////////

// graph pattern keywords beyond basic graph patterns
bool QueryParser::isUnsupportedKeyword(Token token) const
{
  return token == TurtleLexer::Identifier
      && (lexer_->isKeyword("FILTER") || lexer_->isKeyword("OPTIONAL") || lexer_->isKeyword("UNION")
          || lexer_->isKeyword("GRAPH") || lexer_->isKeyword("MINUS") || lexer_->isKeyword("BIND")
          || lexer_->isKeyword("VALUES") || lexer_->isKeyword("SERVICE"));
}

QueryParser::Token QueryParser::next()
{
  return lexer_->getNext();
}

void QueryParser::expect(Token expected, const char* context)
{
  Token token = next();
  if (token != expected) {
    fail(std::string("expected ") + TurtleLexer::tokenName(expected) + " in " + context
         + ", found " + TurtleLexer::tokenName(token));
  }
}

void QueryParser::fail(const std::string& reason)
{
  throw QueryError(reason, lexer_->text());
}
