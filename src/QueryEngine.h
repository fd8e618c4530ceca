#ifndef QUERY_ENGINE_H
#define QUERY_ENGINE_H

#include "Graph.h"
#include "Query.h"

#include <cstddef> // size_t
#include <functional>
#include <map>
#include <string>

// Evaluates queries against one graph.
//
// Basic graph patterns are evaluated as a plain nested-loop join in the
// order the patterns are written: the first pattern is matched against the
// graph, every later pattern is matched with the variables bound so far
// substituted in. There is no query planning. Solutions follow the order in
// which the graph indexes yield matches.
class QueryEngine {
public:
  explicit QueryEngine(const Graph& graph) : graph_(graph) {}

  // Throws QueryError for queries that cannot be evaluated.
  QueryResult execute(const Query& query) const;

  // Calls visitor for each solution of patterns until it returns false.
  void solve(const PatternVector& patterns, const std::function<bool(const Binding&)>& visitor) const;
  // all solutions of patterns
  BindingVector solve(const PatternVector& patterns) const;

  // Checks that every projected, template and DESCRIBE variable occurs
  // in the WHERE clause.
  static void check(const Query& query);

private:
  typedef Graph::KeyType KeyType;
  typedef std::map<std::string, KeyType> KeyBinding;

  // a triple pattern with constants already interned
  struct CompiledPattern {
    std::string variables[3];
    KeyType keys[3];
  };

  const Graph& graph_;

  bool compile(const PatternVector& patterns, std::vector<CompiledPattern>& compiled) const;
  bool join(const std::vector<CompiledPattern>& patterns, std::size_t index, KeyBinding& binding,
            const std::function<bool(const Binding&)>& visitor) const;
  Binding toBinding(const KeyBinding& binding) const;

  void select(const Query& query, QueryResult& result) const;
  void construct(const Query& query, QueryResult& result) const;
  void describe(const Query& query, QueryResult& result) const;
  static bool instantiate(const TriplePattern& pattern, const Binding& binding, Triple& t);
};

#endif
