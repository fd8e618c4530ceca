#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "Engine.h"
#include "types.h"

namespace {

const std::string ex = "http://example.org/";

Term iri(const std::string& local) { return Term::iri(ex + local); }

const char* kPeople =
    "@prefix ex: <http://example.org/> .\n"
    "ex:alice a ex:Student ; ex:name \"Alice\" .\n"
    "ex:bob a ex:Person ; ex:name \"Bob\" .\n"
    "ex:Student rdfs:subClassOf ex:Person .\n";

const char* kShapes =
    "@prefix ex: <http://example.org/> .\n"
    "@prefix sh: <http://www.w3.org/ns/shacl#> .\n"
    "ex:PersonShape a sh:NodeShape ; sh:targetClass ex:Person ;\n"
    "  sh:property [ sh:path ex:name ; sh:minCount 1 ; sh:datatype xsd:string ] .\n";

}

TEST(EngineTest, LoadReportsStatistics)
{
  Engine engine;
  Result<LoadStats> stats = engine.load(
      "<http://example.org/a> <http://example.org/p> <http://example.org/b> .\n"
      "<http://example.org/a> <http://example.org/p> <http://example.org/c> .\n"
      "<http://example.org/a> <http://example.org/p> <http://example.org/b> .\n", kNTriples);
  ASSERT_TRUE(stats.ok()) << stats.error().what();
  EXPECT_EQ(3u, stats.value().triplesParsed);
  EXPECT_EQ(2u, stats.value().triplesAdded);
  EXPECT_EQ(2u, engine.size());

  stats = engine.load("<http://example.org/a> <http://example.org/p> <http://example.org/c> .\n", kNTriples);
  ASSERT_TRUE(stats.ok());
  EXPECT_EQ(1u, stats.value().triplesParsed);
  EXPECT_EQ(0u, stats.value().triplesAdded);
  EXPECT_EQ(2u, engine.size());
}

TEST(EngineTest, FailedLoadAddsNothing)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());
  const std::size_t before = engine.size();

  Result<LoadStats> stats = engine.load(
      "@prefix ex: <http://example.org/> .\n"
      "ex:carol a ex:Person .\n"
      "ex:carol ex:name \"Carol .\n", kTurtle);
  ASSERT_FALSE(stats.ok());
  EXPECT_EQ(Error::kParseError, stats.error().kind());
  EXPECT_EQ(3u, stats.error().line());
  EXPECT_EQ(before, engine.size());
  EXPECT_THROW(stats.value(), Error);
}

TEST(EngineTest, QueryReturnsResultsOrErrors)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());

  Result<QueryResult> result = engine.query("SELECT ?n WHERE { ?p a ex:Person ; ex:name ?n }");
  ASSERT_TRUE(result.ok()) << result.error().what();
  ASSERT_EQ(1u, result.value().rows.size());
  EXPECT_EQ(Term::literal("Bob"), result.value().rows[0].at("n"));

  result = engine.query("SELECT ?n WHERE { ?p a ex:Person FILTER(?p) }");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kQueryError, result.error().kind());
  EXPECT_EQ("FILTER", result.error().fragment());

  result = engine.query("SELECT ?n WHERE { ?p nope:name ?n }");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kQueryError, result.error().kind());
}

TEST(EngineTest, InferencePublishesANewSnapshot)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());
  Engine::Snapshot before = engine.snapshot();

  const std::string ask = "ASK { ex:alice a ex:Person }";
  ASSERT_TRUE(engine.query(ask).ok());
  EXPECT_FALSE(engine.query(ask).value().boolean);

  Result<InferenceReport> report = engine.infer();
  ASSERT_TRUE(report.ok()) << report.error().what();
  EXPECT_EQ(1u, report.value().triplesAdded);
  EXPECT_TRUE(report.value().fixpointReached);
  EXPECT_EQ(0u, report.value().axiomaticTriples);
  EXPECT_TRUE(engine.query(ask).value().boolean);

  // a snapshot taken earlier still sees the old graph
  PatternVector where;
  where.push_back(TriplePattern(iri("alice"), Term::iri(kTypeURI), iri("Person")));
  Result<QueryResult> old = Engine::query(Query::ask(where), before);
  ASSERT_TRUE(old.ok());
  EXPECT_FALSE(old.value().boolean);
  EXPECT_EQ(5u, before->size());
  EXPECT_EQ(6u, engine.size());

  // nothing left to derive, the snapshot is kept
  Engine::Snapshot closed = engine.snapshot();
  report = engine.infer();
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(0u, report.value().triplesAdded);
  EXPECT_EQ(closed, engine.snapshot());
}

TEST(EngineTest, InferenceRoundCap)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());
  Result<InferenceReport> report = engine.infer(0);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(0u, report.value().roundsRun);
  EXPECT_FALSE(report.value().fixpointReached);
  EXPECT_EQ(5u, engine.size());
}

TEST(EngineTest, AxiomsOption)
{
  EngineOptions options;
  options.axioms = true;
  options.ruleSet = Reasoner::kRhoDFRuleSet;
  Engine engine(options);
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());

  Result<InferenceReport> report = engine.infer();
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(39u, report.value().axiomaticTriples);
  EXPECT_TRUE(engine.query("ASK { rdf:type rdfs:domain rdfs:Resource }").value().boolean);
  // rdfs:subClassOf has domain rdfs:Class
  EXPECT_TRUE(engine.query("ASK { ex:Student a rdfs:Class }").value().boolean);
}

TEST(EngineTest, Validation)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());

  Result<ValidationReport> report = engine.validate(kShapes, kTurtle);
  ASSERT_TRUE(report.ok()) << report.error().what();
  EXPECT_TRUE(report.value().conforms);

  ASSERT_TRUE(engine.load("<http://example.org/carol> a <http://example.org/Person> .\n", kTurtle).ok());
  report = engine.validate(kShapes, kTurtle);
  ASSERT_TRUE(report.ok());
  EXPECT_FALSE(report.value().conforms);
  ASSERT_EQ(1u, report.value().violations.size());
  EXPECT_EQ(iri("carol"), report.value().violations[0].focusNode);

  // malformed shapes
  report = engine.validate("<http://example.org/S> a <http://www.w3.org/ns/shacl#NodeShape> .\n", kTurtle);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(Error::kValidationError, report.error().kind());

  // unparsable shapes
  report = engine.validate("this is not turtle", kTurtle);
  ASSERT_FALSE(report.ok());
  EXPECT_EQ(Error::kParseError, report.error().kind());
}

TEST(EngineTest, ExportAndReload)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());

  Result<std::string> turtle = engine.exportGraph(kTurtle);
  ASSERT_TRUE(turtle.ok());
  EXPECT_NE(std::string::npos, turtle.value().find("@prefix ex: <http://example.org/> ."));

  const Format formats[] = { kTurtle, kNTriples, kJsonLd, kRdfXml };
  for (Format format : formats) {
    Result<std::string> text = engine.exportGraph(format);
    ASSERT_TRUE(text.ok()) << formatName(format) << ": " << text.error().what();

    Engine copy;
    Result<LoadStats> stats = copy.load(text.value(), format);
    ASSERT_TRUE(stats.ok()) << formatName(format) << ": " << stats.error().what();
    EXPECT_EQ(engine.snapshot()->triples(), copy.snapshot()->triples()) << formatName(format);
  }
}

TEST(EngineTest, BlankNodesPerLoad)
{
  Engine engine;
  const char* anonymous = "@prefix ex: <http://example.org/> .\n[ ex:p 1 ] .\n";
  ASSERT_TRUE(engine.load(anonymous, kTurtle).ok());
  ASSERT_TRUE(engine.load(anonymous, kTurtle).ok());
  // generated blank nodes of different loads never collide
  EXPECT_EQ(2u, engine.size());

  std::vector<Term> subjects = engine.snapshot()->subjects();
  ASSERT_EQ(2u, subjects.size());
  EXPECT_EQ(Term::blank("l1b1"), subjects[0]);
  EXPECT_EQ(Term::blank("l2b1"), subjects[1]);

  // a label written in a document only names a node within that document
  const char* labelled = "_:x <http://example.org/p> \"1\" .\n";
  ASSERT_TRUE(engine.load(labelled, kNTriples).ok());
  ASSERT_TRUE(engine.load(labelled, kNTriples).ok());
  EXPECT_EQ(4u, engine.size());
}

TEST(EngineTest, LabelledBlankNodesOfDifferentLoadsStayApart)
{
  Engine engine;
  ASSERT_TRUE(engine.load("_:b0 <http://example.org/name> \"Alice\" .\n", kNTriples).ok());
  ASSERT_TRUE(engine.load("_:b0 <http://example.org/name> \"Bob\" .\n", kNTriples).ok());

  Result<QueryResult> result = engine.query(
      "PREFIX ex: <http://example.org/>\n"
      "SELECT ?x WHERE { ?x ex:name \"Alice\" . ?x ex:name \"Bob\" }");
  ASSERT_TRUE(result.ok()) << result.error().what();
  EXPECT_EQ(0u, result.value().rows.size());
  EXPECT_EQ(2u, engine.snapshot()->subjects().size());
}

TEST(EngineTest, DocumentLabelsNeverMeetGeneratedOnes)
{
  Engine engine;
  // the first load generates labels starting with l1b
  ASSERT_TRUE(engine.load(
      "@prefix ex: <http://example.org/> .\n"
      "_:l1b1 ex:p \"labelled\" .\n"
      "[] ex:q \"anonymous\" .\n", kTurtle).ok());
  EXPECT_EQ(2u, engine.size());
  EXPECT_EQ(2u, engine.snapshot()->subjects().size());
}

TEST(EngineTest, JsonLdBlankNodesExportToEveryFormat)
{
  Engine engine;
  ASSERT_TRUE(engine.load(
      "[{\"@id\": \"_:node/1\", \"http://example.org/p\": \"v\"},\n"
      " {\"@id\": \"http://example.org/s\", \"http://example.org/q\": {\"@id\": \"_:node/1\"}}]\n",
      kJsonLd).ok());
  ASSERT_EQ(2u, engine.size());

  const Format formats[] = { kTurtle, kNTriples, kJsonLd, kRdfXml };
  for (Format format : formats) {
    Result<std::string> text = engine.exportGraph(format);
    ASSERT_TRUE(text.ok()) << formatName(format) << ": " << text.error().what();

    Engine copy;
    Result<LoadStats> stats = copy.load(text.value(), format);
    ASSERT_TRUE(stats.ok()) << formatName(format) << ": " << stats.error().what() << "\n" << text.value();
    EXPECT_EQ(engine.snapshot()->triples(), copy.snapshot()->triples()) << formatName(format);
  }
}

TEST(EngineTest, InferredTypesAreReportedOnce)
{
  Engine engine;
  // alice is a Person both by assertion and through ex:Student
  ASSERT_TRUE(engine.load(
      "@prefix ex: <http://example.org/> .\n"
      "ex:alice a ex:Student , ex:Person .\n"
      "ex:bob a ex:Person .\n"
      "ex:Student rdfs:subClassOf ex:Person .\n", kTurtle).ok());
  ASSERT_TRUE(engine.infer().ok());

  Result<QueryResult> result = engine.query("SELECT ?s WHERE { ?s rdf:type ex:Person }");
  ASSERT_TRUE(result.ok()) << result.error().what();
  const BindingVector& rows = result.value().rows;
  ASSERT_EQ(2u, rows.size());
  std::set<Term> subjects;
  for (const Binding& row : rows) {
    subjects.insert(row.at("s"));
  }
  EXPECT_EQ(2u, subjects.size());
  EXPECT_TRUE(subjects.count(iri("alice")));
  EXPECT_TRUE(subjects.count(iri("bob")));
}

TEST(EngineTest, DocumentPrefixesDoNotLeakIntoLaterLoads)
{
  Engine engine;
  ASSERT_TRUE(engine.load(kPeople, kTurtle).ok());

  Result<LoadStats> stats = engine.load("ex:dave a ex:Person .\n", kTurtle);
  ASSERT_FALSE(stats.ok());
  EXPECT_EQ(Error::kResolutionError, stats.error().kind());

  // configured prefixes are always available
  ASSERT_TRUE(engine.load("<http://example.org/dave> a foaf:Person .\n", kTurtle).ok());
  // queries may use prefixes declared by loaded documents
  EXPECT_TRUE(engine.namespaces().has("ex"));
  EXPECT_TRUE(engine.query("ASK { ex:dave a foaf:Person }").value().boolean);
}

TEST(EngineTest, ReadersSeeCompleteSnapshots)
{
  Engine engine;
  std::atomic<bool> done(false);
  std::atomic<int> failures(0);

  std::thread reader([&engine, &done, &failures]() {
    while (!done) {
      Engine::Snapshot snapshot = engine.snapshot();
      // every load adds two triples at once
      if (snapshot->size() % 2 != 0) {
        ++failures;
      }
      if (!engine.query("SELECT ?s WHERE { ?s ?p ?o }").ok()) {
        ++failures;
      }
    }
  });

  for (int i(0); i != 50; ++i) {
    std::string n = std::to_string(i);
    EXPECT_TRUE(engine.load("<http://example.org/s" + n + "> <http://example.org/p> \"a\" .\n"
                            "<http://example.org/s" + n + "> <http://example.org/p> \"b\" .\n", kNTriples).ok());
  }
  done = true;
  reader.join();

  EXPECT_EQ(0, failures.load());
  EXPECT_EQ(100u, engine.size());
}
