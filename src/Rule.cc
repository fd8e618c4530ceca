#include "Rule.h"
#include "types.h"

Vocabulary Vocabulary::intern(Graph& graph)
{
  Vocabulary v;
  v.type          = graph.intern(Term::iri(kTypeURI));
  v.subClassOf    = graph.intern(Term::iri(kSubClassOfURI));
  v.subPropertyOf = graph.intern(Term::iri(kSubPropertyOfURI));
  v.domain        = graph.intern(Term::iri(kDomainURI));
  v.range         = graph.intern(Term::iri(kRangeURI));
  return v;
}

namespace {

// joins (A p B) with (B p C) for a transitive property p
void transitiveClosureStep(const Graph& graph, Graph::KeyType property, IdTripleVector& out)
{
  Graph::Cursor outer = graph.match(0, property, 0);
  Graph::IdTriple ab;
  while (outer.next(ab)) {
    if (Dictionary::isLiteral(ab.object)) {
      continue;
    }
    Graph::Cursor inner = graph.match(ab.object, property, 0);
    Graph::IdTriple bc;
    while (inner.next(bc)) {
      out.push_back(Graph::IdTriple(ab.subject, property, bc.object));
    }
  }
}

inline bool isIRIKey(Graph::KeyType key)
{
  return !Dictionary::isBlank(key) && !Dictionary::isLiteral(key);
}

}

////////////////////////////////////////////////////////////////////////////////

void SubClassTransitivityRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  transitiveClosureStep(graph, v.subClassOf, out);
}

void SubPropertyTransitivityRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  transitiveClosureStep(graph, v.subPropertyOf, out);
}

void TypeInheritanceRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  Graph::Cursor schema = graph.match(0, v.subClassOf, 0);
  Graph::IdTriple sc;
  while (schema.next(sc)) {
    Graph::Cursor instances = graph.match(0, v.type, sc.subject);
    Graph::IdTriple t;
    while (instances.next(t)) {
      out.push_back(Graph::IdTriple(t.subject, v.type, sc.object));
    }
  }
}

void DomainRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  Graph::Cursor schema = graph.match(0, v.domain, 0);
  Graph::IdTriple dom;
  while (schema.next(dom)) {
    if (!isIRIKey(dom.subject)) {
      continue;
    }
    Graph::Cursor uses = graph.match(0, dom.subject, 0);
    Graph::IdTriple t;
    while (uses.next(t)) {
      out.push_back(Graph::IdTriple(t.subject, v.type, dom.object));
    }
  }
}

void RangeRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  Graph::Cursor schema = graph.match(0, v.range, 0);
  Graph::IdTriple rng;
  while (schema.next(rng)) {
    if (!isIRIKey(rng.subject)) {
      continue;
    }
    Graph::Cursor uses = graph.match(0, rng.subject, 0);
    Graph::IdTriple t;
    while (uses.next(t)) {
      // literals cannot be subjects
      if (!Dictionary::isLiteral(t.object)) {
        out.push_back(Graph::IdTriple(t.object, v.type, rng.object));
      }
    }
  }
}

void SubPropertyInheritanceRule::apply(const Graph& graph, const Vocabulary& v, IdTripleVector& out) const
{
  Graph::Cursor schema = graph.match(0, v.subPropertyOf, 0);
  Graph::IdTriple sp;
  while (schema.next(sp)) {
    if (!isIRIKey(sp.subject) || !isIRIKey(sp.object)) {
      continue;
    }
    Graph::Cursor uses = graph.match(0, sp.subject, 0);
    Graph::IdTriple t;
    while (uses.next(t)) {
      out.push_back(Graph::IdTriple(t.subject, sp.object, t.object));
    }
  }
}
