#ifndef NAMESPACE_TABLE_H
#define NAMESPACE_TABLE_H

#include <cstddef> // size_t
#include <map>
#include <string>

// Prefix -> namespace IRI mapping.
// A table lives for a single parse; decoders hand the prefixes they saw
// back to the caller as serialization hints.
class NamespaceTable {
public:
  typedef std::map<std::string, std::string> PrefixMap;
  typedef PrefixMap::const_iterator const_iterator;

  // rdf, rdfs, owl, xsd, foaf and dc
  static NamespaceTable defaults();

  void add(const std::string& prefix, const std::string& iri);
  bool has(const std::string& prefix) const;
  // Expands prefix:local, throws ResolutionError for unknown prefixes.
  std::string resolve(const std::string& prefix, const std::string& local) const;
  // Finds the longest namespace iri starts with.
  // Fails if no namespace matches or the remainder is not a valid local name.
  bool shorten(const std::string& iri, std::string& prefix, std::string& local) const;
  // adds all entries of other, existing prefixes are kept
  void merge(const NamespaceTable& other);

  const_iterator begin() const { return prefixes_.begin(); }
  const_iterator end() const { return prefixes_.end(); }
  std::size_t size() const { return prefixes_.size(); }
  bool empty() const { return prefixes_.empty(); }

  // true if iri starts with a URI scheme
  static bool isAbsolute(const std::string& iri);
  // RFC 3986 reference resolution
  static std::string resolveRelative(const std::string& base, const std::string& reference);

private:
  PrefixMap prefixes_;

  static bool isLocalName(const std::string& local);
};

#endif
