#ifndef RDFXML_CODEC_H
#define RDFXML_CODEC_H

#include "Codec.h"

// RDF/XML read with the libxml2 SAX2 push parser.
// Supports node elements (rdf:Description and typed nodes), rdf:about,
// rdf:ID, rdf:nodeID, rdf:resource, rdf:datatype, xml:lang, xml:base,
// property attributes and rdf:parseType="Resource".
class RdfXmlDecoder : public Decoder {
public:
  DecodeResult decode(const std::string& text, const DecodeOptions& options);
};

// Writes one rdf:Description element per subject.
class RdfXmlEncoder : public Encoder {
public:
  std::string encode(const TripleVector& triples, const EncodeOptions& options);
};

#endif
