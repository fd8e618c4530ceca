#include "QueryEngine.h"
#include "Error.h"

#include <limits>
#include <set>

namespace {

void collectVariables(const PatternVector& patterns, std::set<std::string>& variables)
{
  for (const TriplePattern& p : patterns) {
    if (p.subject.isVariable()) {
      variables.insert(p.subject.variableName());
    }
    if (p.predicate.isVariable()) {
      variables.insert(p.predicate.variableName());
    }
    if (p.object.isVariable()) {
      variables.insert(p.object.variableName());
    }
  }
}

// position of the solution window [offset, offset + limit)
struct Window {
  std::size_t offset;
  std::size_t limit;
  std::size_t seen = 0;

  explicit Window(const Query& query)
    : offset(query.offset),
      limit(query.limit ? *query.limit : std::numeric_limits<std::size_t>::max()) {}

  // true if the solution falls inside the window
  bool accept() { return seen++ >= offset; }
  bool full(std::size_t taken) const { return taken >= limit; }
};

}

void QueryEngine::check(const Query& query)
{
  std::set<std::string> bound;
  collectVariables(query.where, bound);

  switch (query.form) {
    case Query::kSelect:
      if (!query.selectAll && query.variables.empty()) {
        throw QueryError("SELECT without variables", "SELECT");
      }
      for (const std::string& v : query.variables) {
        if (!bound.count(v)) {
          throw QueryError("projected variable ?" + v + " does not occur in WHERE", "?" + v);
        }
      }
      break;
    case Query::kConstruct:
      for (const TriplePattern& p : query.construct) {
        std::set<std::string> used;
        collectVariables(PatternVector(1, p), used);
        for (const std::string& v : used) {
          if (!bound.count(v)) {
            throw QueryError("template variable ?" + v + " does not occur in WHERE", p.toString());
          }
        }
        if (!p.subject.isVariable() && !p.subject.term().isResource()) {
          throw QueryError("literal in subject position of CONSTRUCT template", p.toString());
        }
        if (!p.predicate.isVariable() && !p.predicate.term().isIRI()) {
          throw QueryError("predicate of CONSTRUCT template is not an IRI", p.toString());
        }
      }
      break;
    case Query::kDescribe:
      if (query.describe.isVariable()) {
        if (!bound.count(query.describe.variableName())) {
          throw QueryError("DESCRIBE variable does not occur in WHERE", query.describe.toString());
        }
      } else if (!query.describe.term().isResource() || query.describe.term().value().empty()) {
        throw QueryError("DESCRIBE expects a resource", query.describe.toString());
      }
      break;
    case Query::kAsk:
      break;
  }
}

QueryResult QueryEngine::execute(const Query& query) const
{
  check(query);

  QueryResult result;
  result.form = query.form;
  switch (query.form) {
    case Query::kSelect:
      select(query, result);
      break;
    case Query::kAsk:
      solve(query.where, [&result](const Binding&) {
        result.boolean = true;
        return false;
      });
      break;
    case Query::kConstruct:
      construct(query, result);
      break;
    case Query::kDescribe:
      describe(query, result);
      break;
  }
  return result;
}

////////////////////////////////////////////////////////////////////////////////

void QueryEngine::select(const Query& query, QueryResult& result) const
{
  if (query.selectAll) {
    // variables in order of first appearance
    std::set<std::string> seen;
    for (const TriplePattern& p : query.where) {
      const PatternTerm* positions[] = { &p.subject, &p.predicate, &p.object };
      for (const PatternTerm* position : positions) {
        if (position->isVariable() && seen.insert(position->variableName()).second) {
          result.variables.push_back(position->variableName());
        }
      }
    }
  } else {
    result.variables = query.variables;
  }

  Window window(query);
  std::set<Binding> distinct;
  if (window.full(0)) {
    return;
  }

  solve(query.where, [&](const Binding& solution) {
    Binding row;
    for (const std::string& v : result.variables) {
      auto it(solution.find(v));
      if (it != std::end(solution)) {
        row.insert(*it);
      }
    }
    if (query.distinct && !distinct.insert(row).second) {
      return true;
    }
    if (window.accept()) {
      result.rows.push_back(row);
    }
    return !window.full(result.rows.size());
  });
}

void QueryEngine::construct(const Query& query, QueryResult& result) const
{
  Window window(query);
  if (window.full(0)) {
    return;
  }

  solve(query.where, [&](const Binding& solution) {
    if (!window.accept()) {
      return true;
    }
    for (const TriplePattern& p : query.construct) {
      Triple t;
      if (instantiate(p, solution, t)) {
        result.triples.push_back(t);
      }
    }
    return !window.full(window.seen - window.offset);
  });
}

void QueryEngine::describe(const Query& query, QueryResult& result) const
{
  std::vector<Term> resources;
  if (query.describe.isVariable()) {
    std::set<Term> seen;
    solve(query.where, [&](const Binding& solution) {
      auto it(solution.find(query.describe.variableName()));
      if (it != std::end(solution) && it->second.isResource() && seen.insert(it->second).second) {
        resources.push_back(it->second);
      }
      return true;
    });
  } else {
    bool matched(query.where.empty());
    if (!matched) {
      solve(query.where, [&matched](const Binding&) {
        matched = true;
        return false;
      });
    }
    if (matched) {
      resources.push_back(query.describe.term());
    }
  }

  Window window(query);
  for (const Term& resource : resources) {
    Graph::Cursor cursor = graph_.match(resource, boost::none, boost::none);
    Triple t;
    while (cursor.next(t)) {
      if (window.full(result.triples.size())) {
        return;
      }
      if (window.accept()) {
        result.triples.push_back(t);
      }
    }
  }
}

// Unbound template positions and invalid triples produce nothing.
bool QueryEngine::instantiate(const TriplePattern& pattern, const Binding& binding, Triple& t)
{
  const PatternTerm* positions[] = { &pattern.subject, &pattern.predicate, &pattern.object };
  Term* targets[] = { &t.subject, &t.predicate, &t.object };
  for (int i(0); i != 3; ++i) {
    if (positions[i]->isVariable()) {
      auto it(binding.find(positions[i]->variableName()));
      if (it == std::end(binding)) {
        return false;
      }
      *targets[i] = it->second;
    } else {
      *targets[i] = positions[i]->term();
    }
  }
  return t.isValid();
}

////////////////////////////////////////////////////////////////////////////////

BindingVector QueryEngine::solve(const PatternVector& patterns) const
{
  BindingVector result;
  solve(patterns, [&result](const Binding& b) {
    result.push_back(b);
    return true;
  });
  return result;
}

void QueryEngine::solve(const PatternVector& patterns, const std::function<bool(const Binding&)>& visitor) const
{
  std::vector<CompiledPattern> compiled;
  if (!compile(patterns, compiled)) {
    // a constant the graph has never seen
    return;
  }
  KeyBinding binding;
  join(compiled, 0, binding, visitor);
}

bool QueryEngine::compile(const PatternVector& patterns, std::vector<CompiledPattern>& compiled) const
{
  for (const TriplePattern& p : patterns) {
    CompiledPattern c;
    const PatternTerm* positions[] = { &p.subject, &p.predicate, &p.object };
    for (int i(0); i != 3; ++i) {
      c.keys[i] = 0;
      if (positions[i]->isVariable()) {
        c.variables[i] = positions[i]->variableName();
      } else if (!graph_.lookup(positions[i]->term(), c.keys[i])) {
        return false;
      }
    }
    compiled.push_back(c);
  }
  return true;
}

// Returns false once the visitor asked to stop.
bool QueryEngine::join(const std::vector<CompiledPattern>& patterns, std::size_t index, KeyBinding& binding,
                       const std::function<bool(const Binding&)>& visitor) const
{
  if (index == patterns.size()) {
    return visitor(toBinding(binding));
  }

  const CompiledPattern& pattern = patterns[index];
  KeyType keys[3];
  for (int i(0); i != 3; ++i) {
    keys[i] = pattern.keys[i];
    if (!pattern.variables[i].empty()) {
      auto it(binding.find(pattern.variables[i]));
      keys[i] = it != std::end(binding) ? it->second : 0;
    }
  }

  Graph::Cursor cursor = graph_.match(keys[0], keys[1], keys[2]);
  Graph::IdTriple t;
  while (cursor.next(t)) {
    const KeyType values[] = { t.subject, t.predicate, t.object };
    std::vector<std::string> added;
    bool compatible(true);
    for (int i(0); i != 3 && compatible; ++i) {
      if (keys[i] || pattern.variables[i].empty()) {
        continue;
      }
      // a variable may occur twice in one pattern
      auto it(binding.find(pattern.variables[i]));
      if (it == std::end(binding)) {
        binding.insert(std::make_pair(pattern.variables[i], values[i]));
        added.push_back(pattern.variables[i]);
      } else if (it->second != values[i]) {
        compatible = false;
      }
    }

    bool proceed = !compatible || join(patterns, index + 1, binding, visitor);
    for (const std::string& v : added) {
      binding.erase(v);
    }
    if (!proceed) {
      return false;
    }
  }
  return true;
}

Binding QueryEngine::toBinding(const KeyBinding& binding) const
{
  Binding result;
  for (auto it(std::begin(binding)); it != std::end(binding); ++it) {
    result.insert(std::make_pair(it->first, graph_.term(it->second)));
  }
  return result;
}
