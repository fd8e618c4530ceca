#include "Codec.h"
#include "JsonLdCodec.h"
#include "NTriplesCodec.h"
#include "RdfXmlCodec.h"
#include "TurtleCodec.h"

#include <algorithm>
#include <cctype>
#include <sstream>

bool formatFromName(const std::string& name, Format& format)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
      [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

  if (lower == "turtle" || lower == "ttl") {
    format = kTurtle;
  } else if (lower == "ntriples" || lower == "n-triples" || lower == "nt") {
    format = kNTriples;
  } else if (lower == "jsonld" || lower == "json-ld" || lower == "json") {
    format = kJsonLd;
  } else if (lower == "rdfxml" || lower == "rdf/xml" || lower == "xml" || lower == "rdf" || lower == "owl") {
    format = kRdfXml;
  } else {
    return false;
  }
  return true;
}

bool formatFromExtension(const std::string& path, Format& format)
{
  std::size_t dot = path.rfind('.');
  if (dot == std::string::npos || path.find('/', dot) != std::string::npos) {
    return false;
  }
  return formatFromName(path.substr(dot + 1), format);
}

const char* formatName(Format format)
{
  switch (format) {
    case kTurtle:   return "turtle";
    case kNTriples: return "ntriples";
    case kJsonLd:   return "jsonld";
    case kRdfXml:   return "rdfxml";
  }
  return "unknown";
}

Term BlankNodeLabeler::fresh()
{
  std::ostringstream label;
  label << prefix_ << ++count_;
  return Term::blank(label.str());
}

Term BlankNodeLabeler::labelled(const std::string& label)
{
  auto it(labels_.find(label));
  if (it != labels_.end()) {
    return it->second;
  }
  Term node = fresh();
  labels_.insert(std::make_pair(label, node));
  return node;
}

std::unique_ptr<Decoder> makeDecoder(Format format)
{
  switch (format) {
    case kTurtle:   return std::unique_ptr<Decoder>(new TurtleDecoder);
    case kNTriples: return std::unique_ptr<Decoder>(new NTriplesDecoder);
    case kJsonLd:   return std::unique_ptr<Decoder>(new JsonLdDecoder);
    case kRdfXml:   return std::unique_ptr<Decoder>(new RdfXmlDecoder);
  }
  return std::unique_ptr<Decoder>();
}

std::unique_ptr<Encoder> makeEncoder(Format format)
{
  switch (format) {
    case kTurtle:   return std::unique_ptr<Encoder>(new TurtleEncoder);
    case kNTriples: return std::unique_ptr<Encoder>(new NTriplesEncoder);
    case kJsonLd:   return std::unique_ptr<Encoder>(new JsonLdEncoder);
    case kRdfXml:   return std::unique_ptr<Encoder>(new RdfXmlEncoder);
  }
  return std::unique_ptr<Encoder>();
}

Result<DecodeResult> decode(Format format, const std::string& text, const DecodeOptions& options)
{
  try {
    return makeDecoder(format)->decode(text, options);
  } catch (const Error& e) {
    return e;
  }
}

Result<std::string> encode(Format format, const TripleVector& triples, const EncodeOptions& options)
{
  try {
    return makeEncoder(format)->encode(triples, options);
  } catch (const Error& e) {
    return e;
  }
}
