#include <gtest/gtest.h>

#include <vector>

#include "Graph.h"
#include "Reasoner.h"
#include "types.h"

namespace {

const std::string ex = "http://example.org/";

Term iri(const std::string& local) { return Term::iri(ex + local); }

const Term type = Term::iri(kTypeURI);
const Term subClassOf = Term::iri(kSubClassOfURI);
const Term subPropertyOf = Term::iri(kSubPropertyOfURI);
const Term domain = Term::iri(kDomainURI);
const Term range = Term::iri(kRangeURI);

}

TEST(ReasonerTest, TypesFollowSubClasses)
{
  Graph graph;
  graph.insert(iri("alice"), type, iri("Student"));
  graph.insert(iri("Student"), subClassOf, iri("Person"));

  Reasoner reasoner;
  InferenceReport report = reasoner.infer(graph);
  EXPECT_TRUE(graph.contains(Triple(iri("alice"), type, iri("Person"))));
  EXPECT_EQ(3u, graph.size());
  EXPECT_EQ(1u, report.triplesAdded);
  EXPECT_EQ(2u, report.roundsRun);
  EXPECT_TRUE(report.fixpointReached);
  ASSERT_EQ(2u, report.perRound.size());
  EXPECT_EQ(1u, report.perRound[0]);
  EXPECT_EQ(0u, report.perRound[1]);
}

TEST(ReasonerTest, ChainsAndMonotonicity)
{
  Graph graph;
  graph.insert(iri("A"), subClassOf, iri("B"));
  graph.insert(iri("B"), subClassOf, iri("C"));
  graph.insert(iri("C"), subClassOf, iri("D"));
  graph.insert(iri("x"), type, iri("A"));
  graph.insert(iri("p"), subPropertyOf, iri("q"));
  graph.insert(iri("q"), subPropertyOf, iri("r"));
  const TripleVector original = graph.triples();

  Reasoner reasoner;
  InferenceReport report = reasoner.infer(graph);
  EXPECT_TRUE(report.fixpointReached);

  for (const Triple& t : original) {
    EXPECT_TRUE(graph.contains(t)) << t.toString();
  }
  EXPECT_TRUE(graph.contains(Triple(iri("A"), subClassOf, iri("C"))));
  EXPECT_TRUE(graph.contains(Triple(iri("A"), subClassOf, iri("D"))));
  EXPECT_TRUE(graph.contains(Triple(iri("B"), subClassOf, iri("D"))));
  EXPECT_TRUE(graph.contains(Triple(iri("x"), type, iri("B"))));
  EXPECT_TRUE(graph.contains(Triple(iri("x"), type, iri("C"))));
  EXPECT_TRUE(graph.contains(Triple(iri("x"), type, iri("D"))));
  EXPECT_TRUE(graph.contains(Triple(iri("p"), subPropertyOf, iri("r"))));
  // core rules do not copy property values up the hierarchy
  EXPECT_EQ(original.size() + 7, graph.size());

  // the closure is a fixpoint
  InferenceReport again = reasoner.infer(graph);
  EXPECT_EQ(0u, again.triplesAdded);
  EXPECT_EQ(1u, again.roundsRun);
  EXPECT_TRUE(again.fixpointReached);
}

TEST(ReasonerTest, RoundCap)
{
  Graph graph;
  graph.insert(iri("alice"), type, iri("Student"));
  graph.insert(iri("Student"), subClassOf, iri("Person"));

  Reasoner reasoner;
  InferenceReport none = reasoner.infer(graph, 0);
  EXPECT_EQ(0u, none.roundsRun);
  EXPECT_EQ(0u, none.triplesAdded);
  EXPECT_FALSE(none.fixpointReached);
  EXPECT_EQ(2u, graph.size());

  // one round derives the triple but cannot confirm nothing else follows
  InferenceReport one = reasoner.infer(graph, 1);
  EXPECT_EQ(1u, one.roundsRun);
  EXPECT_EQ(1u, one.triplesAdded);
  EXPECT_FALSE(one.fixpointReached);
  EXPECT_TRUE(graph.contains(Triple(iri("alice"), type, iri("Person"))));
}

TEST(ReasonerTest, RhoDFRules)
{
  Graph graph;
  graph.insert(iri("knows"), domain, iri("Person"));
  graph.insert(iri("knows"), range, iri("Person"));
  graph.insert(iri("name"), range, iri("Name"));
  graph.insert(iri("hasFather"), subPropertyOf, iri("hasParent"));
  graph.insert(iri("alice"), iri("knows"), iri("bob"));
  graph.insert(iri("alice"), iri("name"), Term::literal("Alice"));
  graph.insert(iri("alice"), iri("hasFather"), iri("carl"));

  Graph core(graph);
  Reasoner().infer(core);
  EXPECT_EQ(graph.size(), core.size());

  Reasoner reasoner(Reasoner::kRhoDFRuleSet);
  EXPECT_EQ(Reasoner::kRhoDFRuleSet, reasoner.ruleSet());
  EXPECT_EQ(6u, reasoner.ruleCount());
  InferenceReport report = reasoner.infer(graph);
  EXPECT_TRUE(report.fixpointReached);

  EXPECT_TRUE(graph.contains(Triple(iri("alice"), type, iri("Person"))));
  EXPECT_TRUE(graph.contains(Triple(iri("bob"), type, iri("Person"))));
  EXPECT_TRUE(graph.contains(Triple(iri("alice"), iri("hasParent"), iri("carl"))));
  // literal objects never become subjects
  for (const Triple& t : graph.triples()) {
    EXPECT_FALSE(t.subject.isLiteral());
  }
  EXPECT_EQ(10u, graph.size());
}

TEST(ReasonerTest, ClosureLeavesTheInputUnchanged)
{
  Graph graph;
  graph.insert(iri("alice"), type, iri("Student"));
  graph.insert(iri("Student"), subClassOf, iri("Person"));

  InferenceReport report;
  Graph closed = Reasoner().closure(graph, report);
  EXPECT_EQ(2u, graph.size());
  EXPECT_FALSE(graph.contains(Triple(iri("alice"), type, iri("Person"))));
  EXPECT_EQ(3u, closed.size());
  EXPECT_TRUE(closed.contains(Triple(iri("alice"), type, iri("Person"))));
  EXPECT_EQ(1u, report.triplesAdded);
}

TEST(ReasonerTest, AxiomaticTriples)
{
  Graph graph;
  EXPECT_EQ(39u, Reasoner::addAxiomaticTriples(graph));
  EXPECT_EQ(0u, Reasoner::addAxiomaticTriples(graph));
  EXPECT_TRUE(graph.contains(Triple(type, domain, Term::iri(kResourceURI))));
  EXPECT_TRUE(graph.contains(Triple(Term::iri(kDatatypeURI), subClassOf, Term::iri(kClassURI))));

  // membership properties in use get their own axioms
  Graph bag;
  const Term first = Term::iri(kRDFNamespace + "_1");
  bag.insert(iri("bag"), first, iri("item"));
  EXPECT_EQ(42u, Reasoner::addAxiomaticTriples(bag));
  EXPECT_TRUE(bag.contains(Triple(first, type, Term::iri(kConMemShipPropURI))));

  // axioms feed the ordinary rules
  Reasoner().infer(bag);
  EXPECT_TRUE(bag.contains(Triple(first, type, Term::iri(kPropertyURI))));
  EXPECT_TRUE(bag.contains(Triple(Term::iri(kXMLLiteralURI), type, Term::iri(kClassURI))));
}
