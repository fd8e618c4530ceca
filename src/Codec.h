#ifndef CODEC_H
#define CODEC_H

#include "Error.h"
#include "NamespaceTable.h"
#include "Triple.h"

#include <map>
#include <memory>
#include <string>

// Supported RDF syntaxes
enum Format {
  kTurtle,
  kNTriples,
  kJsonLd,
  kRdfXml
};

// turtle, ttl, ntriples, nt, jsonld, json-ld, rdfxml, xml, rdf
bool formatFromName(const std::string& name, Format& format);
// guesses the format from a file name extension
bool formatFromExtension(const std::string& path, Format& format);
const char* formatName(Format format);

struct DecodeOptions {
  // prefixes usable without a declaration in the document
  NamespaceTable namespaces;
  // base IRI for relative references, may be empty
  std::string baseIRI;
  // label prefix for the blank nodes of the document, followed by a counter
  std::string blankPrefix = "genid";
};

struct DecodeResult {
  TripleVector triples;
  // prefixes declared by the document
  NamespaceTable namespaces;
};

struct EncodeOptions {
  NamespaceTable namespaces;
};

// Blank node labels of one decode. Labels written in the document are
// mapped to generated ones, so they never meet the nodes the decoder
// invents and always use the restricted label syntax of N-Triples.
class BlankNodeLabeler {
public:
  explicit BlankNodeLabeler(const std::string& prefix) : prefix_(prefix) {}

  // a new node
  Term fresh();
  // the node a document label stands for
  Term labelled(const std::string& label);

private:
  std::string prefix_;
  std::size_t count_ = 0;
  std::map<std::string, Term> labels_;
};

class Decoder {
public:
  virtual ~Decoder() {}
  // Throws ParseError or ResolutionError, nothing is returned on failure.
  virtual DecodeResult decode(const std::string& text, const DecodeOptions& options) = 0;
};

class Encoder {
public:
  virtual ~Encoder() {}
  // Throws EncodeError for triples the syntax cannot express.
  virtual std::string encode(const TripleVector& triples, const EncodeOptions& options) = 0;
};

std::unique_ptr<Decoder> makeDecoder(Format format);
std::unique_ptr<Encoder> makeEncoder(Format format);

// Decodes text as a whole: either every triple or an error.
Result<DecodeResult> decode(Format format, const std::string& text, const DecodeOptions& options);
Result<std::string> encode(Format format, const TripleVector& triples, const EncodeOptions& options);

#endif
