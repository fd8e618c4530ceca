#include "Dictionary.h"

#include <stdexcept>

const Dictionary::KeyType Dictionary::blankMask;
const Dictionary::KeyType Dictionary::literalMask;
const Dictionary::KeyType Dictionary::indexMask;

////////////////////////////////////////////////////////////////////////////////

Dictionary::KeyType Dictionary::Lookup(const Term& term)
{
  auto it(ids_.find(term));
  if (it != std::end(ids_)) {
    return it->second;
  }

  // no id was found, so we create a new entry
  terms_.push_back(term);
  KeyType key = terms_.size();
  if (term.isBlank()) {
    key |= blankMask;
  } else if (term.isLiteral()) {
    key |= literalMask;
  }
  ids_.insert(std::make_pair(term, key));
  return key;
}

////////////////////////////////////////////////////////////////////////////////

bool Dictionary::Lookup(const Term& term, KeyType& key) const
{
  auto it(ids_.find(term));
  if (it == std::end(ids_)) {
    return false;
  }
  key = it->second;
  return true;
}

////////////////////////////////////////////////////////////////////////////////

const Term& Dictionary::Find(KeyType key) const
{
  KeyType index = key & indexMask;
  if (index == 0 || index > terms_.size()) {
    throw std::out_of_range("unknown term key");
  }
  return terms_[index - 1];
}
