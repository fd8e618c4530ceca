#ifndef RULE_H
#define RULE_H

#include "Graph.h"

#include <vector>

// Keys of the schema vocabulary in one graph
struct Vocabulary {
  typedef Graph::KeyType KeyType;

  KeyType type = 0;
  KeyType subClassOf = 0;
  KeyType subPropertyOf = 0;
  KeyType domain = 0;
  KeyType range = 0;

  // interns the vocabulary terms into graph
  static Vocabulary intern(Graph& graph);
};

typedef std::vector<Graph::IdTriple> IdTripleVector;

// A built-in entailment rule.
// apply() only reads the graph; derived triples are appended to out and may
// already be present in the graph.
class Rule {
public:
  virtual ~Rule() {}
  virtual const char* name() const = 0;
  virtual void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const = 0;
};

// rdfs11: (A subClassOf B), (B subClassOf C) -> (A subClassOf C)
class SubClassTransitivityRule : public Rule {
public:
  const char* name() const { return "rdfs11"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

// rdfs5: (P subPropertyOf Q), (Q subPropertyOf R) -> (P subPropertyOf R)
class SubPropertyTransitivityRule : public Rule {
public:
  const char* name() const { return "rdfs5"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

// rdfs9: (X type A), (A subClassOf B) -> (X type B)
class TypeInheritanceRule : public Rule {
public:
  const char* name() const { return "rdfs9"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

// rdfs2: (P domain C), (X P Y) -> (X type C)
class DomainRule : public Rule {
public:
  const char* name() const { return "rdfs2"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

// rdfs3: (P range C), (X P Y) -> (Y type C) for non-literal Y
class RangeRule : public Rule {
public:
  const char* name() const { return "rdfs3"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

// rdfs7: (P subPropertyOf Q), (X P Y) -> (X Q Y)
class SubPropertyInheritanceRule : public Rule {
public:
  const char* name() const { return "rdfs7"; }
  void apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const;
};

#endif
