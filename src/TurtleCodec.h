#ifndef TURTLE_CODEC_H
#define TURTLE_CODEC_H

#include "Codec.h"

class TurtleDecoder : public Decoder {
public:
  DecodeResult decode(const std::string& text, const DecodeOptions& options);
};

// Groups triples by subject and writes predicate lists separated by ';'
// and object lists separated by ','.
class TurtleEncoder : public Encoder {
public:
  std::string encode(const TripleVector& triples, const EncodeOptions& options);
};

#endif
