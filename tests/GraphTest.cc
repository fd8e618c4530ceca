#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "Error.h"
#include "Graph.h"
#include "types.h"

namespace {

const std::string ex = "http://example.org/";

Term iri(const std::string& local) { return Term::iri(ex + local); }

class GraphTest : public ::testing::Test {
protected:
  void SetUp()
  {
    triples_.push_back(Triple(iri("alice"), iri("knows"), iri("bob")));
    triples_.push_back(Triple(iri("alice"), iri("knows"), iri("carol")));
    triples_.push_back(Triple(iri("alice"), iri("name"), Term::literal("Alice")));
    triples_.push_back(Triple(iri("bob"), iri("knows"), iri("carol")));
    triples_.push_back(Triple(iri("bob"), iri("name"), Term::langLiteral("Bob", "en")));
    triples_.push_back(Triple(Term::blank("x"), iri("knows"), iri("alice")));
    triples_.push_back(Triple(iri("carol"), Term::iri(kTypeURI), iri("Person")));
    triples_.push_back(Triple(iri("carol"), iri("age"), Term::typedLiteral("42", kXSDIntegerURI)));
    for (const Triple& t : triples_) {
      graph_.insert(t);
    }
  }

  std::set<Triple> collect(Graph::Cursor cursor)
  {
    std::set<Triple> result;
    Triple t;
    while (cursor.next(t)) {
      EXPECT_TRUE(result.insert(t).second) << "duplicate match " << t;
    }
    return result;
  }

  TripleVector triples_;
  Graph graph_;
};

}

TEST_F(GraphTest, InsertionIsIdempotent)
{
  EXPECT_EQ(triples_.size(), graph_.size());
  EXPECT_FALSE(graph_.insert(triples_[0]));
  EXPECT_FALSE(graph_.insert(triples_[5]));
  EXPECT_EQ(triples_.size(), graph_.size());
  EXPECT_TRUE(graph_.insert(iri("dave"), iri("knows"), iri("alice")));
  EXPECT_EQ(triples_.size() + 1, graph_.size());
}

TEST_F(GraphTest, RejectsInvalidTriples)
{
  EXPECT_THROW(graph_.insert(Term::literal("s"), iri("p"), iri("o")), ParseError);
  EXPECT_THROW(graph_.insert(iri("s"), Term::blank("p"), iri("o")), ParseError);
  EXPECT_THROW(graph_.insert(iri("s"), Term::literal("p"), iri("o")), ParseError);
  EXPECT_EQ(triples_.size(), graph_.size());
}

TEST_F(GraphTest, Contains)
{
  for (const Triple& t : triples_) {
    EXPECT_TRUE(graph_.contains(t)) << t;
  }
  EXPECT_FALSE(graph_.contains(Triple(iri("bob"), iri("knows"), iri("alice"))));
  EXPECT_FALSE(graph_.contains(Triple(iri("nobody"), iri("knows"), iri("alice"))));
}

// every bound/unbound combination returns exactly the matching triples
TEST_F(GraphTest, PatternCompleteness)
{
  for (const Triple& probe : triples_) {
    for (int mask(0); mask != 8; ++mask) {
      Graph::TermPattern s, p, o;
      if (mask & 1) {
        s = probe.subject;
      }
      if (mask & 2) {
        p = probe.predicate;
      }
      if (mask & 4) {
        o = probe.object;
      }

      std::set<Triple> expected;
      for (const Triple& t : triples_) {
        if ((!s || t.subject == *s) && (!p || t.predicate == *p) && (!o || t.object == *o)) {
          expected.insert(t);
        }
      }

      EXPECT_EQ(expected, collect(graph_.match(s, p, o))) << "pattern " << mask << " for " << probe;
    }
  }
}

TEST_F(GraphTest, MatchUnknownTermIsEmpty)
{
  EXPECT_TRUE(collect(graph_.match(iri("nobody"), boost::none, boost::none)).empty());
  EXPECT_TRUE(collect(graph_.match(boost::none, iri("unknown"), boost::none)).empty());
  EXPECT_TRUE(collect(graph_.match(boost::none, boost::none, Term::literal("nothing"))).empty());
}

TEST_F(GraphTest, IterationIsCanonicalAndRestartable)
{
  TripleVector first;
  for (auto it(graph_.begin()); it != graph_.end(); ++it) {
    first.push_back(graph_.toTriple(*it));
  }
  TripleVector second = graph_.triples();
  EXPECT_EQ(first, second);
  EXPECT_EQ(triples_.size(), first.size());
  EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));

  TripleVector sorted(triples_);
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, first);
}

TEST_F(GraphTest, CopyIsIndependentSnapshot)
{
  Graph copy(graph_);
  EXPECT_TRUE(copy.insert(iri("dave"), iri("knows"), iri("erin")));
  EXPECT_EQ(triples_.size() + 1, copy.size());
  EXPECT_EQ(triples_.size(), graph_.size());
  EXPECT_FALSE(graph_.contains(Triple(iri("dave"), iri("knows"), iri("erin"))));

  TripleVector copied = copy.triples();
  EXPECT_TRUE(std::is_sorted(copied.begin(), copied.end()));

  Graph assigned;
  assigned = copy;
  EXPECT_EQ(copy.triples(), assigned.triples());
}

TEST_F(GraphTest, Subjects)
{
  std::vector<Term> subjects = graph_.subjects();
  ASSERT_EQ(4u, subjects.size());
  EXPECT_EQ(iri("alice"), subjects[0]);
  EXPECT_EQ(iri("bob"), subjects[1]);
  EXPECT_EQ(iri("carol"), subjects[2]);
  EXPECT_EQ(Term::blank("x"), subjects[3]);
}

TEST_F(GraphTest, Statistics)
{
  graph_.insert(iri("onto"), Term::iri(kTypeURI), Term::iri(kOWLOntologyURI));
  graph_.insert(iri("Student"), Term::iri(kSubClassOfURI), iri("Person"));

  Graph::Statistics stats = graph_.statistics();
  EXPECT_EQ(triples_.size() + 2, stats.triples);
  EXPECT_EQ(6u, stats.subjects);
  ASSERT_EQ(1u, stats.ontologies.size());
  EXPECT_EQ(iri("onto"), stats.ontologies[0]);
  // Person, owl:Ontology, Student
  EXPECT_EQ(3u, stats.classes);
}

TEST(GraphCursorTest, DefaultCursorIsExhausted)
{
  Graph::Cursor cursor;
  Triple t;
  EXPECT_FALSE(cursor.next(t));
}
