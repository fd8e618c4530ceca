#include "Graph.h"
#include "Error.h"
#include "types.h"

#include <iterator>

#define ROT(val, shift) (((val) >> shift) | ((val) << (64 - shift)))

const uint64_t Graph::IdTriple::k0;
const uint64_t Graph::IdTriple::k1;
const uint64_t Graph::IdTriple::k2;
const uint64_t Graph::IdTriple::k3;
const uint64_t Graph::IdTriple::kMul;

bool Graph::IdTriple::operator==(const IdTriple& rhs) const
{
  return subject == rhs.subject && predicate == rhs.predicate && object == rhs.object;
}

bool Graph::IdTriple::operator!=(const IdTriple& rhs) const
{
  return subject != rhs.subject || predicate != rhs.predicate || object != rhs.object;
}

// Hashes a key triple.
// Subject, predicate and object are interpreted as one
// byte sequence which is hashed using Google's CityHash
// specialized for a length of 24 bytes.
// See: http://code.google.com/p/cityhash
std::size_t Graph::IdTriple::hash() const
{
  uint64_t a = this->subject * k1;
  uint64_t b = this->predicate;
  uint64_t c = this->object * k2;
  uint64_t d = this->predicate * k0;

  d = ROT(a - b, 43) + ROT(c, 30) + d;
  b = a + ROT(b ^ k3, 20) - c + 24 /* len */;

  c = (d ^ b) * kMul;
  c ^= (c >> 47);
  b = (b ^ c) * kMul;
  b ^= (b >> 47);
  b *= kMul;

  return static_cast<std::size_t>(b);
}

bool Graph::CanonicalOrder::operator()(const IdTriple& lhs, const IdTriple& rhs) const
{
  if (lhs.subject != rhs.subject) {
    return dict_->Find(lhs.subject) < dict_->Find(rhs.subject);
  }
  if (lhs.predicate != rhs.predicate) {
    return dict_->Find(lhs.predicate) < dict_->Find(rhs.predicate);
  }
  if (lhs.object != rhs.object) {
    return dict_->Find(lhs.object) < dict_->Find(rhs.object);
  }
  return false;
}

////////////////////////////////////////////////////////////////////////////////

bool Graph::Cursor::next(IdTriple& t)
{
  if (single_) {
    if (done_) {
      return false;
    }
    t = singleTriple_;
    done_ = true;
    return true;
  }

  while (!done_) {
    if (middle_ != middleEnd_) {
      const KeyVector& leaf = middle_->second;
      if (inner_ < leaf.size()) {
        KeyType a = outer_->first;
        KeyType b = middle_->first;
        KeyType c = leaf[inner_++];
        switch (order_) {
          case kSPO: t = IdTriple(a, b, c); break;
          case kPOS: t = IdTriple(c, a, b); break;
          case kOSP: t = IdTriple(b, c, a); break;
        }
        return true;
      }
      ++middle_;
      inner_ = 0;
      continue;
    }

    // second level exhausted, move on to the next first level key
    ++outer_;
    if (outer_ == outerEnd_) {
      done_ = true;
      break;
    }
    middle_ = outer_->second.begin();
    middleEnd_ = outer_->second.end();
    inner_ = 0;
  }

  return false;
}

bool Graph::Cursor::next(Triple& t)
{
  IdTriple keys;
  if (!next(keys)) {
    return false;
  }
  t = Triple(dict_->Find(keys.subject), dict_->Find(keys.predicate), dict_->Find(keys.object));
  return true;
}

////////////////////////////////////////////////////////////////////////////////

Graph::Graph() : canonical_(CanonicalOrder(&dict_))
{
}

Graph::Graph(const Graph& other)
  : dict_(other.dict_),
    triples_(other.triples_),
    canonical_(CanonicalOrder(&dict_)),
    spo_(other.spo_),
    pos_(other.pos_),
    osp_(other.osp_)
{
  // the comparator must refer to our own dictionary
  canonical_.insert(other.canonical_.begin(), other.canonical_.end());
}

Graph& Graph::operator=(const Graph& other)
{
  if (this != &other) {
    dict_ = other.dict_;
    triples_ = other.triples_;
    spo_ = other.spo_;
    pos_ = other.pos_;
    osp_ = other.osp_;
    canonical_.clear();
    canonical_.insert(other.canonical_.begin(), other.canonical_.end());
  }
  return *this;
}

bool Graph::insert(const Triple& t)
{
  if (!t.isValid()) {
    throw ParseError("not a valid RDF triple: " + t.toString());
  }
  return addTriple(IdTriple(dict_.Lookup(t.subject), dict_.Lookup(t.predicate), dict_.Lookup(t.object)));
}

bool Graph::addTriple(const IdTriple& t)
{
  if (!triples_.insert(t).second) {
    return false;
  }

  canonical_.insert(t);
  addToIndex(spo_, t.subject, t.predicate, t.object);
  addToIndex(pos_, t.predicate, t.object, t.subject);
  addToIndex(osp_, t.object, t.subject, t.predicate);
  return true;
}

void Graph::addToIndex(Index& index, KeyType a, KeyType b, KeyType c)
{
  index[a][b].push_back(c);
}

bool Graph::contains(const Triple& t) const
{
  KeyType s, p, o;
  if (!lookup(t.subject, s) || !lookup(t.predicate, p) || !lookup(t.object, o)) {
    return false;
  }
  return contains(IdTriple(s, p, o));
}

Graph::Cursor Graph::match(const TermPattern& s, const TermPattern& p, const TermPattern& o) const
{
  KeyType sk(0), pk(0), ok(0);
  // a bound term the dictionary has never seen cannot match anything
  if ((s && !lookup(*s, sk)) || (p && !lookup(*p, pk)) || (o && !lookup(*o, ok))) {
    return Cursor();
  }
  return match(sk, pk, ok);
}

Graph::Cursor Graph::match(KeyType s, KeyType p, KeyType o) const
{
  Cursor cursor;
  if (s && p && o) {
    // fully bound, degrade to a membership test
    IdTriple t(s, p, o);
    cursor.single_ = true;
    cursor.singleTriple_ = t;
    cursor.done_ = !contains(t);
  } else if (s) {
    cursor = o ? scan(osp_, Cursor::kOSP, o, s) : scan(spo_, Cursor::kSPO, s, p);
  } else if (p) {
    cursor = scan(pos_, Cursor::kPOS, p, o);
  } else if (o) {
    cursor = scan(osp_, Cursor::kOSP, o, 0);
  } else {
    cursor = scan(spo_, Cursor::kSPO, 0, 0);
  }
  cursor.dict_ = &dict_;
  return cursor;
}

Graph::Cursor Graph::scan(const Index& index, Cursor::Order order, KeyType first, KeyType second)
{
  Cursor cursor;
  cursor.order_ = order;

  if (first) {
    auto it(index.find(first));
    if (it == std::end(index)) {
      return cursor;
    }
    cursor.outer_ = it;
    cursor.outerEnd_ = std::next(it);
  } else {
    if (index.empty()) {
      return cursor;
    }
    cursor.outer_ = index.begin();
    cursor.outerEnd_ = index.end();
  }

  if (second) {
    auto it(cursor.outer_->second.find(second));
    if (it == std::end(cursor.outer_->second)) {
      return cursor;
    }
    cursor.middle_ = it;
    cursor.middleEnd_ = std::next(it);
  } else {
    cursor.middle_ = cursor.outer_->second.begin();
    cursor.middleEnd_ = cursor.outer_->second.end();
  }

  cursor.inner_ = 0;
  cursor.done_ = false;
  return cursor;
}

TripleVector Graph::triples() const
{
  TripleVector result;
  result.reserve(size());
  for (auto it(begin()); it != end(); ++it) {
    result.push_back(toTriple(*it));
  }
  return result;
}

Triple Graph::toTriple(const IdTriple& t) const
{
  return Triple(dict_.Find(t.subject), dict_.Find(t.predicate), dict_.Find(t.object));
}

std::vector<Term> Graph::subjects() const
{
  std::vector<Term> result;
  for (auto it(begin()); it != end(); ++it) {
    if (result.empty() || result.back() != term(it->subject)) {
      result.push_back(term(it->subject));
    }
  }
  return result;
}

Graph::Statistics Graph::statistics() const
{
  Statistics stats;
  stats.triples = size();
  stats.subjects = spo_.size();
  stats.predicates = pos_.size();
  stats.objects = osp_.size();

  std::set<KeyType> classes, properties;
  for (auto it(pos_.begin()); it != pos_.end(); ++it) {
    properties.insert(it->first);
  }

  KeyType type, subClassOf, subPropertyOf;
  if (lookup(Term::iri(kTypeURI), type)) {
    IdTriple t;
    Cursor cursor(match(0, type, 0));
    while (cursor.next(t)) {
      classes.insert(t.object);
      const Term& cls = term(t.object);
      if (cls.value() == kClassURI || cls.value() == kOWLClassURI) {
        classes.insert(t.subject);
      } else if (cls.value() == kPropertyURI || cls.value() == kOWLObjectPropURI
          || cls.value() == kOWLDataPropURI) {
        properties.insert(t.subject);
      } else if (cls.value() == kOWLOntologyURI) {
        stats.ontologies.push_back(term(t.subject));
      }
    }
  }
  if (lookup(Term::iri(kSubClassOfURI), subClassOf)) {
    IdTriple t;
    Cursor cursor(match(0, subClassOf, 0));
    while (cursor.next(t)) {
      classes.insert(t.subject);
      classes.insert(t.object);
    }
  }
  if (lookup(Term::iri(kSubPropertyOfURI), subPropertyOf)) {
    IdTriple t;
    Cursor cursor(match(0, subPropertyOf, 0));
    while (cursor.next(t)) {
      properties.insert(t.subject);
      properties.insert(t.object);
    }
  }

  stats.classes = classes.size();
  stats.properties = properties.size();
  return stats;
}
