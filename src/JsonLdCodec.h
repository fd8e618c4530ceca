#ifndef JSONLD_CODEC_H
#define JSONLD_CODEC_H

#include "Codec.h"

// JSON-LD documents read and written through jsoncpp. Native numbers
// become xsd:integer or xsd:double and booleans xsd:boolean, null values
// and empty arrays produce no triple.
class JsonLdDecoder : public Decoder {
public:
  DecodeResult decode(const std::string& text, const DecodeOptions& options);
};

// Writes one node object per subject inside @graph, with the used
// prefixes as @context.
class JsonLdEncoder : public Encoder {
public:
  std::string encode(const TripleVector& triples, const EncodeOptions& options);
};

#endif
