#include <gtest/gtest.h>

#include <set>

#include "Codec.h"
#include "Graph.h"
#include "QueryEngine.h"
#include "QueryParser.h"
#include "types.h"

namespace {

const std::string ex = "http://example.org/";

Term iri(const std::string& local) { return Term::iri(ex + local); }

class QueryTest : public ::testing::Test {
protected:
  Graph graph;

  void SetUp() override
  {
    DecodeOptions options;
    options.namespaces = NamespaceTable::defaults();
    Result<DecodeResult> data = decode(kTurtle,
        "@prefix ex: <http://example.org/> .\n"
        "ex:alice a ex:Student ; ex:name \"Alice\" ; ex:knows ex:bob , ex:carol .\n"
        "ex:bob a ex:Person ; ex:name \"Bob\" ; ex:knows ex:carol ; ex:age 42 .\n"
        "ex:carol a ex:Person ; ex:name \"Carol\"@en .\n"
        "ex:Student rdfs:subClassOf ex:Person .\n", options);
    ASSERT_TRUE(data.ok()) << data.error().what();
    for (const Triple& t : data.value().triples) {
      graph.insert(t);
    }
  }

  QueryResult run(const std::string& text)
  {
    QueryParser parser;
    return QueryEngine(graph).execute(parser.parse(
        "PREFIX ex: <http://example.org/>\n" + text));
  }

  std::set<Term> column(const QueryResult& result, const std::string& variable)
  {
    std::set<Term> values;
    for (const Binding& row : result.rows) {
      auto it(row.find(variable));
      if (it != row.end()) {
        values.insert(it->second);
      }
    }
    return values;
  }
};

}

TEST_F(QueryTest, SelectBindsProjectedVariables)
{
  QueryResult result = run("SELECT ?name WHERE { ?p a ex:Person ; ex:name ?name }");
  EXPECT_EQ(Query::kSelect, result.form);
  ASSERT_EQ(1u, result.variables.size());
  EXPECT_EQ("name", result.variables[0]);
  ASSERT_EQ(2u, result.rows.size());

  std::set<Term> expected;
  expected.insert(Term::literal("Bob"));
  expected.insert(Term::langLiteral("Carol", "en"));
  EXPECT_EQ(expected, column(result, "name"));
  // only projected variables are returned
  EXPECT_EQ(0u, result.rows[0].count("p"));
}

TEST_F(QueryTest, JoinsSharedVariables)
{
  QueryResult result = run("SELECT ?a ?c WHERE { ?a ex:knows ?b . ?b ex:knows ?c . }");
  ASSERT_EQ(1u, result.rows.size());
  EXPECT_EQ(iri("alice"), result.rows[0].at("a"));
  EXPECT_EQ(iri("carol"), result.rows[0].at("c"));
}

TEST_F(QueryTest, RepeatedVariableInOnePattern)
{
  EXPECT_EQ(0u, run("SELECT ?x WHERE { ?x ex:knows ?x }").rows.size());

  graph.insert(iri("dave"), iri("knows"), iri("dave"));
  QueryResult result = run("SELECT ?x WHERE { ?x ex:knows ?x }");
  ASSERT_EQ(1u, result.rows.size());
  EXPECT_EQ(iri("dave"), result.rows[0].at("x"));
}

TEST_F(QueryTest, ConstantsInPatterns)
{
  QueryResult result = run("SELECT ?p WHERE { ?p ex:name \"Bob\" }");
  ASSERT_EQ(1u, result.rows.size());
  EXPECT_EQ(iri("bob"), result.rows[0].at("p"));

  result = run("SELECT ?p WHERE { ?p ex:age 42 }");
  ASSERT_EQ(1u, result.rows.size());
  EXPECT_EQ(iri("bob"), result.rows[0].at("p"));

  // language tags are part of the literal
  EXPECT_EQ(0u, run("SELECT ?p WHERE { ?p ex:name \"Carol\" }").rows.size());
  EXPECT_EQ(1u, run("SELECT ?p WHERE { ?p ex:name \"Carol\"@EN }").rows.size());
}

TEST_F(QueryTest, Distinct)
{
  EXPECT_EQ(3u, run("SELECT ?b WHERE { ?a ex:knows ?b }").rows.size());

  QueryResult result = run("SELECT DISTINCT ?b WHERE { ?a ex:knows ?b }");
  ASSERT_EQ(2u, result.rows.size());
  std::set<Term> expected;
  expected.insert(iri("bob"));
  expected.insert(iri("carol"));
  EXPECT_EQ(expected, column(result, "b"));
}

TEST_F(QueryTest, SelectAllUsesVariablesInOrderOfAppearance)
{
  QueryResult result = run("SELECT * WHERE { ?s ex:knows ?o . ?o ex:name ?n }");
  std::vector<std::string> expected;
  expected.push_back("s");
  expected.push_back("o");
  expected.push_back("n");
  EXPECT_EQ(expected, result.variables);
  EXPECT_EQ(3u, result.rows.size());
}

TEST_F(QueryTest, LimitAndOffset)
{
  QueryResult all = run("SELECT ?s ?p ?o WHERE { ?s ?p ?o }");
  ASSERT_EQ(graph.size(), all.rows.size());

  QueryResult first = run("SELECT ?s ?p ?o WHERE { ?s ?p ?o } LIMIT 2");
  ASSERT_EQ(2u, first.rows.size());
  EXPECT_EQ(all.rows[0], first.rows[0]);
  EXPECT_EQ(all.rows[1], first.rows[1]);

  QueryResult rest = run("SELECT ?s ?p ?o WHERE { ?s ?p ?o } OFFSET 2");
  ASSERT_EQ(all.rows.size() - 2, rest.rows.size());
  EXPECT_EQ(all.rows[2], rest.rows[0]);

  QueryResult window = run("SELECT ?s ?p ?o WHERE { ?s ?p ?o } OFFSET 3 LIMIT 2");
  ASSERT_EQ(2u, window.rows.size());
  EXPECT_EQ(all.rows[3], window.rows[0]);
  EXPECT_EQ(all.rows[4], window.rows[1]);

  EXPECT_EQ(0u, run("SELECT ?s WHERE { ?s ?p ?o } LIMIT 0").rows.size());
  EXPECT_EQ(0u, run("SELECT ?s WHERE { ?s ?p ?o } OFFSET 100").rows.size());
}

TEST_F(QueryTest, Ask)
{
  QueryResult result = run("ASK { ex:alice ex:knows ex:bob }");
  EXPECT_EQ(Query::kAsk, result.form);
  EXPECT_TRUE(result.boolean);
  EXPECT_EQ(1u, result.size());

  EXPECT_FALSE(run("ASK WHERE { ex:bob ex:knows ex:alice }").boolean);
  // a constant the graph has never seen
  EXPECT_FALSE(run("ASK { ?x a ex:NonExistentClass }").boolean);
}

TEST_F(QueryTest, Construct)
{
  QueryResult result = run("CONSTRUCT { ?b ex:knownBy ?a } WHERE { ?a ex:knows ?b }");
  EXPECT_EQ(Query::kConstruct, result.form);

  std::set<Triple> expected;
  expected.insert(Triple(iri("bob"), iri("knownBy"), iri("alice")));
  expected.insert(Triple(iri("carol"), iri("knownBy"), iri("alice")));
  expected.insert(Triple(iri("carol"), iri("knownBy"), iri("bob")));
  EXPECT_EQ(expected, std::set<Triple>(result.triples.begin(), result.triples.end()));

  // the source graph is not modified
  EXPECT_FALSE(graph.contains(Triple(iri("bob"), iri("knownBy"), iri("alice"))));
}

TEST_F(QueryTest, ConstructSkipsInvalidTriples)
{
  // ?n is bound to literals, which cannot be subjects
  QueryResult result = run("CONSTRUCT { ?n ex:nameOf ?p . ?p ex:label ?n } WHERE { ?p ex:name ?n }");
  EXPECT_EQ(3u, result.triples.size());
  for (const Triple& t : result.triples) {
    EXPECT_EQ(iri("label"), t.predicate);
  }
}

TEST_F(QueryTest, Describe)
{
  QueryResult result = run("DESCRIBE ex:bob");
  EXPECT_EQ(Query::kDescribe, result.form);
  EXPECT_EQ(4u, result.triples.size());
  for (const Triple& t : result.triples) {
    EXPECT_EQ(iri("bob"), t.subject);
  }

  result = run("DESCRIBE ?p WHERE { ?p a ex:Student }");
  EXPECT_EQ(4u, result.triples.size());
  for (const Triple& t : result.triples) {
    EXPECT_EQ(iri("alice"), t.subject);
  }

  EXPECT_EQ(0u, run("DESCRIBE ex:nobody").triples.size());
}

TEST_F(QueryTest, ParseErrorsCarryTheFragment)
{
  QueryParser parser;
  try {
    parser.parse("SELECT ?x WHERE { ?x foo:bar ?y }");
    FAIL() << "unknown prefix accepted";
  } catch (const QueryError& e) {
    EXPECT_EQ(Error::kQueryError, e.kind());
    EXPECT_EQ("foo:bar", e.fragment());
  }

  try {
    parser.parse("SELECT ?x WHERE { ?x ?p ?y FILTER(?x) }");
    FAIL() << "FILTER accepted";
  } catch (const QueryError& e) {
    EXPECT_EQ("FILTER", e.fragment());
    EXPECT_NE(std::string::npos, e.reason().find("not supported"));
  }

  EXPECT_THROW(parser.parse("SELECT ?x WHERE { ?x ?p ?y } ORDER BY ?x"), QueryError);
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { ?x ?p ?y OPTIONAL { ?x ?q ?z } }"), QueryError);
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { _:b ?p ?x }"), QueryError);
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { <relative> ?p ?x }"), QueryError);
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { ?x ?p ?y "), QueryError);
  EXPECT_THROW(parser.parse("SELECT WHERE { ?x ?p ?y }"), QueryError);
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { ?x ?p ?y } LIMIT -1"), QueryError);
  EXPECT_THROW(parser.parse("INSERT DATA { <http://a> <http://b> <http://c> }"), QueryError);
  // lexical errors are query errors too
  EXPECT_THROW(parser.parse("SELECT ?x WHERE { ?x ?p \"open }"), QueryError);
}

TEST_F(QueryTest, BaseAndConfiguredPrefixes)
{
  NamespaceTable namespaces;
  namespaces.add("ex", ex);
  QueryParser parser(namespaces);
  Query query = parser.parse("BASE <http://example.org/> SELECT ?n WHERE { <bob> ex:name ?n }");
  QueryResult result = QueryEngine(graph).execute(query);
  ASSERT_EQ(1u, result.rows.size());
  EXPECT_EQ(Term::literal("Bob"), result.rows[0].at("n"));

  // rdfs is not configured for this parser
  EXPECT_THROW(parser.parse("SELECT ?c WHERE { ?c rdfs:subClassOf ?d }"), QueryError);
}

TEST_F(QueryTest, UnboundProjectionIsRejected)
{
  EXPECT_THROW(run("SELECT ?missing WHERE { ?s ?p ?o }"), QueryError);
  EXPECT_THROW(run("CONSTRUCT { ?missing ex:p ?o } WHERE { ?s ?p ?o }"), QueryError);
  EXPECT_THROW(run("DESCRIBE ?missing WHERE { ?s ?p ?o }"), QueryError);
}

TEST_F(QueryTest, ProgrammaticQueries)
{
  PatternVector where;
  where.push_back(TriplePattern(PatternTerm::variable("s"), Term::iri(kTypeURI), iri("Person")));
  std::vector<std::string> variables(1, "s");

  QueryResult result = QueryEngine(graph).execute(Query::select(variables, where));
  std::set<Term> expected;
  expected.insert(iri("bob"));
  expected.insert(iri("carol"));
  EXPECT_EQ(expected, column(result, "s"));

  EXPECT_TRUE(QueryEngine(graph).execute(Query::ask(where)).boolean);

  BindingVector solutions = QueryEngine(graph).solve(where);
  EXPECT_EQ(2u, solutions.size());
}

TEST_F(QueryTest, JsonResults)
{
  std::string json = run("SELECT ?n WHERE { ex:carol ex:name ?n }").toJson();
  EXPECT_NE(std::string::npos, json.find("\"vars\""));
  EXPECT_NE(std::string::npos, json.find("\"type\": \"literal\""));
  EXPECT_NE(std::string::npos, json.find("\"xml:lang\": \"en\""));
  EXPECT_NE(std::string::npos, json.find("\"value\": \"Carol\""));

  json = run("SELECT ?n WHERE { ex:nobody ex:name ?n }").toJson();
  EXPECT_NE(std::string::npos, json.find("\"bindings\": []"));

  EXPECT_NE(std::string::npos, run("ASK { ex:alice a ex:Student }").toJson().find("\"boolean\": true"));
  EXPECT_NE(std::string::npos, run("ASK { ex:alice a ex:Person }").toJson().find("\"boolean\": false"));
  EXPECT_NE(std::string::npos, run("ASK { ex:alice a ex:Person }").toJson().find("\"head\": {}"));

  json = run("DESCRIBE ex:carol").toJson();
  EXPECT_NE(std::string::npos, json.find("\"triples\""));
  EXPECT_NE(std::string::npos, json.find("\"type\": \"uri\""));
}
