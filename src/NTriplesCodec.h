#ifndef NTRIPLES_CODEC_H
#define NTRIPLES_CODEC_H

#include "Codec.h"

// One triple per line, absolute IRIs only, no prefixes.
class NTriplesDecoder : public Decoder {
public:
  DecodeResult decode(const std::string& text, const DecodeOptions& options);
};

// Writes the canonical, diff-stable form: one fully expanded triple per line.
class NTriplesEncoder : public Encoder {
public:
  std::string encode(const TripleVector& triples, const EncodeOptions& options);
};

#endif
