#ifndef QUERY_H
#define QUERY_H

#include "Term.h"
#include "Triple.h"

#include <cstddef> // size_t
#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>

// One position of a triple pattern: a variable or a concrete term.
class PatternTerm {
public:
  PatternTerm() {}
  PatternTerm(const Term& term) : term_(term) {}

  // name without the leading '?'
  static PatternTerm variable(const std::string& name);

  bool isVariable() const { return !variable_.empty(); }
  const std::string& variableName() const { return variable_; }
  const Term& term() const { return term_; }

  // ?name or the N-Triples form of the term
  std::string toString() const;

private:
  std::string variable_;
  Term term_;
};

struct TriplePattern {
  PatternTerm subject;
  PatternTerm predicate;
  PatternTerm object;

  TriplePattern() {}
  TriplePattern(const PatternTerm& s, const PatternTerm& p, const PatternTerm& o)
    : subject(s), predicate(p), object(o) {}

  std::string toString() const;
};

typedef std::vector<TriplePattern> PatternVector;

// A solution mapping: variable name -> bound term
typedef std::map<std::string, Term> Binding;
typedef std::vector<Binding> BindingVector;

// A parsed or programmatically built query.
struct Query {
  enum Form {
    kSelect,
    kAsk,
    kConstruct,
    kDescribe
  };

  Form form = kSelect;
  // projected variables, empty with selectAll for SELECT *
  std::vector<std::string> variables;
  bool selectAll = false;
  bool distinct = false;
  // basic graph pattern, joined left to right
  PatternVector where;
  // CONSTRUCT template
  PatternVector construct;
  // DESCRIBE target, a resource or a variable bound by where
  PatternTerm describe;
  boost::optional<std::size_t> limit;
  std::size_t offset = 0;

  static Query select(const std::vector<std::string>& variables, const PatternVector& where);
  static Query ask(const PatternVector& where);
  static Query constructQuery(const PatternVector& templatePatterns, const PatternVector& where);
  static Query describeQuery(const PatternTerm& resource, const PatternVector& where = PatternVector());

  static const char* formName(Form form);
};

struct QueryResult {
  Query::Form form = Query::kSelect;
  std::vector<std::string> variables;
  BindingVector rows;
  // ASK
  bool boolean = false;
  // CONSTRUCT and DESCRIBE
  TripleVector triples;

  // number of rows, triples or 1/0 for ASK
  std::size_t size() const;
  // SPARQL 1.1 query results JSON for SELECT and ASK,
  // a list of subject/predicate/object term objects for graph forms
  std::string toJson() const;
};

#endif
