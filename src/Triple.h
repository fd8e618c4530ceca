#ifndef TRIPLE_H
#define TRIPLE_H

#include "Term.h"

#include <cstddef> // size_t
#include <ostream>
#include <string>
#include <vector>

// A (subject, predicate, object) statement made of terms.
struct Triple {
  Term subject;
  Term predicate;
  Term object;

  Triple() {}
  Triple(const Term& s, const Term& p, const Term& o)
    : subject(s), predicate(p), object(o) {}

  // subject is an IRI or blank node and predicate an IRI
  bool isValid() const { return subject.isResource() && predicate.isIRI() && !predicate.value().empty(); }
  // N-Triples line without the trailing newline
  std::string toString() const;
  std::size_t hash() const;

  bool operator==(const Triple& rhs) const;
  bool operator!=(const Triple& rhs) const { return !(*this == rhs); }
  bool operator<(const Triple& rhs) const;
};

typedef std::vector<Triple> TripleVector;

struct TripleHasher {
  std::size_t operator()(const Triple& t) const { return t.hash(); }
};

std::ostream& operator<<(std::ostream& outStream, const Triple& t);

#endif
