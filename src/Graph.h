#ifndef GRAPH_H
#define GRAPH_H

#include "Dictionary.h"
#include "Term.h"
#include "Triple.h"

#include <cstddef> // size_t
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>
#include <boost/optional.hpp>

// In-memory set of triples.
// Terms are interned in a per-graph Dictionary; triples are stored as key
// triples in a hash set (membership), a canonically ordered set (iteration)
// and three nested indexes (SPO, POS, OSP) used for pattern matching.
class Graph {
public:
  typedef Dictionary::KeyType KeyType;
  // a term or "any"
  typedef boost::optional<Term> TermPattern;

  struct IdTriple {
    KeyType subject;
    KeyType predicate;
    KeyType object;
    IdTriple() : subject(0), predicate(0), object(0) {};
    IdTriple(KeyType s, KeyType p, KeyType o)
      : subject(s), predicate(p), object(o) {};
    std::size_t hash() const;
    bool operator==(const IdTriple& rhs) const;
    bool operator!=(const IdTriple& rhs) const;
  private:
    static const uint64_t k0   = 0xc3a5c85c97cb3127ULL;
    static const uint64_t k1   = 0xb492b66fbe98f273ULL;
    static const uint64_t k2   = 0x9ae16a3b2f90404fULL;
    static const uint64_t k3   = 0xc949d7c7509e6557ULL;
    static const uint64_t kMul = 0x9ddfea08eb382d69ULL;
  }; // Graph::IdTriple

private:
  typedef std::vector<KeyType> KeyVector;
  typedef std::map<KeyType, KeyVector> SecondLevel;
  typedef std::map<KeyType, SecondLevel> Index;

  struct IdTripleHasher {
    std::size_t operator()(const IdTriple& t) const { return t.hash(); }
  };

  // orders key triples by the terms they stand for
  struct CanonicalOrder {
    explicit CanonicalOrder(const Dictionary* dict) : dict_(dict) {}
    bool operator()(const IdTriple& lhs, const IdTriple& rhs) const;
  private:
    const Dictionary* dict_;
  };

  typedef std::set<IdTriple, CanonicalOrder> CanonicalSet;

public:
  // Lazy result of a pattern match.
  // Pulls triples from one index range; the graph must not be
  // modified while a cursor is in use.
  class Cursor {
  public:
    // an exhausted cursor
    Cursor() : done_(true) {}
    bool next(IdTriple& t);
    bool next(Triple& t);

  private:
    friend class Graph;
    enum Order {
      kSPO,
      kPOS,
      kOSP
    };

    const Dictionary* dict_ = nullptr;
    Order order_ = kSPO;
    Index::const_iterator outer_;
    Index::const_iterator outerEnd_;
    SecondLevel::const_iterator middle_;
    SecondLevel::const_iterator middleEnd_;
    std::size_t inner_ = 0;
    // fully bound pattern: at most one result
    bool single_ = false;
    IdTriple singleTriple_;
    bool done_;
  }; // Graph::Cursor

  struct Statistics {
    std::size_t triples = 0;
    std::size_t subjects = 0;
    std::size_t predicates = 0;
    std::size_t objects = 0;
    std::size_t classes = 0;
    std::size_t properties = 0;
    std::vector<Term> ontologies;
  };

  typedef CanonicalSet::const_iterator const_iterator;

  Graph();
  Graph(const Graph& other);
  Graph& operator=(const Graph& other);

  // Adds a triple, returns false if it was already present.
  // Throws ParseError if the triple is not valid RDF.
  bool insert(const Triple& t);
  bool insert(const Term& s, const Term& p, const Term& o) { return insert(Triple(s, p, o)); }
  // keys must have been issued by this graph's dictionary
  bool addTriple(const IdTriple& t);

  bool contains(const Triple& t) const;
  bool contains(const IdTriple& t) const { return triples_.find(t) != std::end(triples_); }

  // All triples matching the bound components, boost::none matches anything.
  Cursor match(const TermPattern& s, const TermPattern& p, const TermPattern& o) const;
  // 0 matches anything
  Cursor match(KeyType s, KeyType p, KeyType o) const;

  // iteration in canonical (term) order
  const_iterator begin() const { return canonical_.begin(); }
  const_iterator end() const { return canonical_.end(); }

  std::size_t size() const { return triples_.size(); }
  bool empty() const { return triples_.empty(); }

  // all triples as terms, in canonical order
  TripleVector triples() const;
  Triple toTriple(const IdTriple& t) const;
  const Term& term(KeyType key) const { return dict_.Find(key); }
  // key of term without interning it
  bool lookup(const Term& term, KeyType& key) const { return dict_.Lookup(term, key); }
  // key of term, interning it if necessary
  KeyType intern(const Term& term) { return dict_.Lookup(term); }
  const Dictionary& dictionary() const { return dict_; }

  // distinct subjects in canonical order
  std::vector<Term> subjects() const;
  Statistics statistics() const;

private:
  Dictionary dict_;
  std::unordered_set<IdTriple, IdTripleHasher> triples_;
  CanonicalSet canonical_;
  Index spo_;
  Index pos_;
  Index osp_;

  static void addToIndex(Index& index, KeyType a, KeyType b, KeyType c);
  static Cursor scan(const Index& index, Cursor::Order order, KeyType first, KeyType second);
};

#endif
