#ifndef QUERY_PARSER_H
#define QUERY_PARSER_H

#include "NamespaceTable.h"
#include "Query.h"
#include "TurtleLexer.h"

#include <string>

// Parser for the supported SPARQL subset:
//   PREFIX / BASE prologue,
//   SELECT [DISTINCT] (?v ... | *), ASK, CONSTRUCT { ... }, DESCRIBE <iri>|pname|?v,
//   an optional WHERE keyword before a group of triple patterns ('.', ';', ',' and 'a'),
//   LIMIT and OFFSET.
// Every failure is reported as a QueryError carrying the offending fragment.
class QueryParser {
public:
  // prefixes usable without a PREFIX declaration
  explicit QueryParser(const NamespaceTable& namespaces = NamespaceTable::defaults());

  Query parse(const std::string& text);

private:
  typedef TurtleLexer::Token Token;

  NamespaceTable initial_;
  NamespaceTable namespaces_;
  std::string base_;
  TurtleLexer* lexer_ = nullptr;

  void parsePrologue();
  void parseSelectClause(Query& query);
  void parseDescribeTarget(Query& query);
  void parseWhere(Query& query);
  void parseGroup(PatternVector& patterns);
  void parseTriplesSameSubject(Token token, PatternVector& patterns);
  void parseModifiers(Query& query);
  std::size_t parseCount(const char* keyword);

  PatternTerm parseSubject(Token token);
  PatternTerm parsePredicate(Token token);
  PatternTerm parseObject(Token token);
  Term parseLiteral();
  Term resolveIRI(const std::string& iri);
  Term resolvePrefixedName();

  bool isUnsupportedKeyword(Token token) const;
  Token next();
  void expect(Token expected, const char* context);
  void fail(const std::string& reason);
};

#endif
