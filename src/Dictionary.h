#ifndef DICTIONARY_H
#define DICTIONARY_H

#include "Term.h"
#include "types.h"

#include <cstddef> // size_t
#include <unordered_map>
#include <vector>

// Interns RDF terms and hands out integer keys for them.
// The two most significant bits of a key tell whether the term
// is a blank node or a literal, so triples can be classified
// without going back to the dictionary.
class Dictionary {
public:
  // The type we return as keys (i.e. term IDs).
  typedef term_id KeyType;

  static const KeyType blankMask   = (1ULL << (sizeof(KeyType) * 8 - 1));
  static const KeyType literalMask = (1ULL << (sizeof(KeyType) * 8 - 2));
  static const KeyType indexMask   = ~(blankMask | literalMask);

  // lookup term and return its ID, creating a new one if necessary
  KeyType Lookup(const Term& term);
  // lookup term without creating an ID, returns false if unknown
  bool Lookup(const Term& term, KeyType& key) const;
  // Find the term for key
  const Term& Find(KeyType key) const;
  // returns the current size (number of entries)
  std::size_t Size() const { return terms_.size(); }

  static bool isBlank(KeyType key) { return (key & blankMask) != 0; }
  static bool isLiteral(KeyType key) { return (key & literalMask) != 0; }

private:
  typedef std::unordered_map<Term, KeyType, TermHasher> KeyMap;

  // maps terms to ids
  KeyMap ids_;
  // stores terms at index (key - 1)
  std::vector<Term> terms_;
};

#endif
