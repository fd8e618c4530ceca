#include <gtest/gtest.h>

#include <set>

#include "Codec.h"
#include "types.h"

namespace {

const std::string ex = "http://example.org/";

Term iri(const std::string& local) { return Term::iri(ex + local); }

std::set<Triple> asSet(const TripleVector& triples)
{
  return std::set<Triple>(triples.begin(), triples.end());
}

Result<DecodeResult> decodeTurtle(const std::string& text, const std::string& base = "")
{
  DecodeOptions options;
  options.namespaces = NamespaceTable::defaults();
  options.baseIRI = base;
  return decode(kTurtle, text, options);
}

}

TEST(TurtleCodecTest, PrefixesAndAbbreviations)
{
  Result<DecodeResult> result = decodeTurtle(
      "@prefix ex: <http://example.org/> .\n"
      "ex:alice a ex:Student ;\n"
      "    ex:knows ex:bob , ex:carol ;\n"
      "    foaf:name \"Alice\" .\n");
  ASSERT_TRUE(result.ok()) << result.error().what();

  std::set<Triple> expected;
  expected.insert(Triple(iri("alice"), Term::iri(kTypeURI), iri("Student")));
  expected.insert(Triple(iri("alice"), iri("knows"), iri("bob")));
  expected.insert(Triple(iri("alice"), iri("knows"), iri("carol")));
  expected.insert(Triple(iri("alice"), Term::iri("http://xmlns.com/foaf/0.1/name"), Term::literal("Alice")));
  EXPECT_EQ(expected, asSet(result.value().triples));

  // only declared prefixes are reported back
  EXPECT_TRUE(result.value().namespaces.has("ex"));
  EXPECT_FALSE(result.value().namespaces.has("foaf"));
}

TEST(TurtleCodecTest, SparqlStyleDirectivesAndBase)
{
  Result<DecodeResult> result = decodeTurtle(
      "BASE <http://example.org/data/>\n"
      "PREFIX ex: <../>\n"
      "<alice> ex:knows <#bob> .\n");
  ASSERT_TRUE(result.ok()) << result.error().what();
  ASSERT_EQ(1u, result.value().triples.size());
  const Triple& t = result.value().triples[0];
  EXPECT_EQ(Term::iri("http://example.org/data/alice"), t.subject);
  EXPECT_EQ(iri("knows"), t.predicate);
  EXPECT_EQ(Term::iri("http://example.org/data/#bob"), t.object);
}

TEST(TurtleCodecTest, LiteralForms)
{
  Result<DecodeResult> result = decodeTurtle(
      "@prefix ex: <http://example.org/> .\n"
      "ex:s ex:int 5 ; ex:neg -3 ; ex:dec 2.5 ; ex:dbl 1e3 ; ex:bool true ;\n"
      "     ex:typed \"5\"^^xsd:integer ; ex:lang \"chat\"@fr ;\n"
      "     ex:long \"\"\"first line\n\"second\" line\"\"\" ;\n"
      "     ex:single 'it\\'s' .\n");
  ASSERT_TRUE(result.ok()) << result.error().what();

  std::set<Triple> triples = asSet(result.value().triples);
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("int"), Term::typedLiteral("5", kXSDIntegerURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("neg"), Term::typedLiteral("-3", kXSDIntegerURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("dec"), Term::typedLiteral("2.5", kXSDDecimalURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("dbl"), Term::typedLiteral("1e3", kXSDDoubleURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("bool"), Term::typedLiteral("true", kXSDBooleanURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("typed"), Term::typedLiteral("5", kXSDIntegerURI))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("lang"), Term::langLiteral("chat", "fr"))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("long"), Term::literal("first line\n\"second\" line"))));
  EXPECT_TRUE(triples.count(Triple(iri("s"), iri("single"), Term::literal("it's"))));
  EXPECT_EQ(9u, triples.size());
}

TEST(TurtleCodecTest, BlankNodesAndCollections)
{
  DecodeOptions options;
  options.blankPrefix = "t";
  options.namespaces.add("ex", ex);
  Result<DecodeResult> result = decode(kTurtle,
      "ex:alice ex:address [ ex:city \"Paris\" ; ex:zip \"75001\" ] .\n"
      "_:n ex:list ( ex:a ex:b ) .\n"
      "[] ex:empty () .\n", options);
  ASSERT_TRUE(result.ok()) << result.error().what();

  std::set<Triple> triples = asSet(result.value().triples);
  Term address = Term::blank("t1");
  EXPECT_TRUE(triples.count(Triple(iri("alice"), iri("address"), address)));
  EXPECT_TRUE(triples.count(Triple(address, iri("city"), Term::literal("Paris"))));
  EXPECT_TRUE(triples.count(Triple(address, iri("zip"), Term::literal("75001"))));

  Term first = Term::iri(kFirstURI);
  Term rest = Term::iri(kRestURI);
  Term nil = Term::iri(kNilURI);
  // the document label _:n is numbered like the anonymous nodes
  EXPECT_TRUE(triples.count(Triple(Term::blank("t2"), iri("list"), Term::blank("t3"))));
  EXPECT_TRUE(triples.count(Triple(Term::blank("t3"), first, iri("a"))));
  EXPECT_TRUE(triples.count(Triple(Term::blank("t3"), rest, Term::blank("t4"))));
  EXPECT_TRUE(triples.count(Triple(Term::blank("t4"), first, iri("b"))));
  EXPECT_TRUE(triples.count(Triple(Term::blank("t4"), rest, nil)));
  EXPECT_TRUE(triples.count(Triple(Term::blank("t5"), iri("empty"), nil)));
  EXPECT_EQ(9u, triples.size());
}

TEST(TurtleCodecTest, UnknownPrefixIsAnError)
{
  Result<DecodeResult> result = decodeTurtle("ex:a ex:b ex:c .\n");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kResolutionError, result.error().kind());
  EXPECT_EQ(1u, result.error().line());
}

TEST(TurtleCodecTest, RelativeIRIWithoutBaseIsAnError)
{
  Result<DecodeResult> result = decodeTurtle("<a> <http://example.org/p> <http://example.org/o> .\n");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kResolutionError, result.error().kind());
}

TEST(TurtleCodecTest, SyntaxErrorsDiscardTheDocument)
{
  Result<DecodeResult> result = decodeTurtle(
      "@prefix ex: <http://example.org/> .\n"
      "ex:a ex:b ex:c .\n"
      "ex:a ex:b \"unterminated .\n");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kParseError, result.error().kind());

  result = decodeTurtle("@prefix ex: <http://example.org/> .\nex:a ex:b ex:c\n");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(Error::kParseError, result.error().kind());

  // a literal cannot have both a language and a datatype
  result = decodeTurtle("@prefix ex: <http://example.org/> .\nex:a ex:b \"x\"@en^^xsd:string .\n");
  EXPECT_FALSE(result.ok());
}

TEST(TurtleCodecTest, TypedLiteralSurvivesConversionToNTriples)
{
  Result<DecodeResult> decoded = decodeTurtle(
      "@prefix ex: <http://example.org/> .\nex:s ex:p \"5\"^^xsd:integer .\n");
  ASSERT_TRUE(decoded.ok());
  Result<std::string> text = encode(kNTriples, decoded.value().triples, EncodeOptions());
  ASSERT_TRUE(text.ok());
  EXPECT_EQ("<http://example.org/s> <http://example.org/p> \"5\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n",
            text.value());
}

TEST(TurtleCodecTest, EncoderGroupsBySubject)
{
  TripleVector triples;
  triples.push_back(Triple(iri("alice"), Term::iri(kTypeURI), iri("Person")));
  triples.push_back(Triple(iri("alice"), iri("knows"), iri("bob")));
  triples.push_back(Triple(iri("alice"), iri("knows"), iri("carol")));
  triples.push_back(Triple(iri("bob"), iri("name"), Term::typedLiteral("Bob", kXSDStringURI)));

  EncodeOptions options;
  options.namespaces = NamespaceTable::defaults();
  options.namespaces.add("ex", ex);
  Result<std::string> text = encode(kTurtle, triples, options);
  ASSERT_TRUE(text.ok());

  EXPECT_EQ("@prefix ex: <http://example.org/> .\n"
            "\n"
            "ex:alice\n"
            "    a ex:Person ;\n"
            "    ex:knows ex:bob ,\n"
            "        ex:carol .\n"
            "\n"
            "ex:bob\n"
            "    ex:name \"Bob\" .\n", text.value());
}

TEST(TurtleCodecTest, RoundTrip)
{
  TripleVector triples;
  triples.push_back(Triple(iri("s"), iri("p"), Term::literal("multi\nline \"quoted\"")));
  triples.push_back(Triple(iri("s"), iri("p"), Term::typedLiteral("5", kXSDIntegerURI)));
  triples.push_back(Triple(iri("s"), iri("p"), Term::langLiteral("hi", "en")));
  triples.push_back(Triple(iri("s"), Term::iri(kTypeURI), iri("Thing")));
  triples.push_back(Triple(Term::blank("genid1"), iri("q"), Term::iri("urn:isbn:123")));
  triples.push_back(Triple(Term::iri("http://other.org/x"), iri("p-2"), Term::blank("genid1")));

  EncodeOptions options;
  options.namespaces = NamespaceTable::defaults();
  options.namespaces.add("ex", ex);
  Result<std::string> text = encode(kTurtle, triples, options);
  ASSERT_TRUE(text.ok());

  Result<DecodeResult> decoded = decodeTurtle(text.value());
  ASSERT_TRUE(decoded.ok()) << decoded.error().what() << "\n" << text.value();
  EXPECT_EQ(asSet(triples), asSet(decoded.value().triples));
}
