#include "Triple.h"

#include <boost/functional/hash.hpp>

std::string Triple::toString() const
{
  return subject.toString() + " " + predicate.toString() + " " + object.toString() + " .";
}

std::size_t Triple::hash() const
{
  std::size_t seed = subject.hash();
  boost::hash_combine(seed, predicate.hash());
  boost::hash_combine(seed, object.hash());
  return seed;
}

bool Triple::operator==(const Triple& rhs) const
{
  return subject == rhs.subject && predicate == rhs.predicate && object == rhs.object;
}

bool Triple::operator<(const Triple& rhs) const
{
  if (subject != rhs.subject) {
    return subject < rhs.subject;
  }
  if (predicate != rhs.predicate) {
    return predicate < rhs.predicate;
  }
  return object < rhs.object;
}

std::ostream& operator<<(std::ostream& outStream, const Triple& t)
{
  return outStream << t.toString();
}
