#include "NamespaceTable.h"
#include "Error.h"
#include "types.h"

#include <cctype>
#include <vector>

NamespaceTable NamespaceTable::defaults()
{
  NamespaceTable table;
  table.add("rdf", kRDFNamespace);
  table.add("rdfs", kRDFSNamespace);
  table.add("owl", kOWLNamespace);
  table.add("xsd", kXSDNamespace);
  table.add("foaf", "http://xmlns.com/foaf/0.1/");
  table.add("dc", "http://purl.org/dc/elements/1.1/");
  return table;
}

void NamespaceTable::add(const std::string& prefix, const std::string& iri)
{
  prefixes_[prefix] = iri;
}

bool NamespaceTable::has(const std::string& prefix) const
{
  return prefixes_.find(prefix) != prefixes_.end();
}

std::string NamespaceTable::resolve(const std::string& prefix, const std::string& local) const
{
  auto it(prefixes_.find(prefix));
  if (it == prefixes_.end()) {
    throw ResolutionError("unknown prefix '" + prefix + ":'");
  }
  return it->second + local;
}

bool NamespaceTable::shorten(const std::string& iri, std::string& prefix, std::string& local) const
{
  std::size_t best = 0;
  bool found = false;
  for (auto it(prefixes_.begin()); it != prefixes_.end(); ++it) {
    const std::string& ns = it->second;
    if (ns.empty() || ns.size() < best || ns.size() > iri.size()) {
      continue;
    }
    if (iri.compare(0, ns.size(), ns) == 0 && isLocalName(iri.substr(ns.size()))) {
      if (!found || ns.size() > best) {
        best = ns.size();
        prefix = it->first;
        local = iri.substr(ns.size());
        found = true;
      }
    }
  }
  return found;
}

void NamespaceTable::merge(const NamespaceTable& other)
{
  for (auto it(other.begin()); it != other.end(); ++it) {
    prefixes_.insert(*it);
  }
}

// Conservative subset of PN_LOCAL that needs no escaping in Turtle
bool NamespaceTable::isLocalName(const std::string& local)
{
  if (local.empty()) {
    return true;
  }
  for (std::size_t i(0); i != local.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(local[i]);
    if (std::isalnum(c) || c == '_') {
      continue;
    }
    if ((c == '-' || c == '.') && i != 0 && i + 1 != local.size()) {
      continue;
    }
    return false;
  }
  return true;
}

bool NamespaceTable::isAbsolute(const std::string& iri)
{
  if (iri.empty() || !std::isalpha(static_cast<unsigned char>(iri[0]))) {
    return false;
  }
  for (std::size_t i(1); i != iri.size(); ++i) {
    char c = iri[i];
    if (c == ':') {
      return true;
    }
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return false;
}

namespace {

std::string removeDotSegments(const std::string& path)
{
  std::vector<std::string> segments;
  std::size_t pos = 0;
  bool absolute = !path.empty() && path[0] == '/';
  if (absolute) {
    pos = 1;
  }
  bool trailingSlash = false;
  while (pos <= path.size()) {
    std::size_t next = path.find('/', pos);
    std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
    trailingSlash = (segment == "." || segment == "..");
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
    } else if (segment != ".") {
      segments.push_back(segment);
    }
    if (next == std::string::npos) {
      break;
    }
    pos = next + 1;
  }
  if (trailingSlash) {
    segments.push_back(std::string());
  }

  std::string result = absolute ? "/" : "";
  for (std::size_t i(0); i != segments.size(); ++i) {
    if (i) {
      result += '/';
    }
    result += segments[i];
  }
  return result;
}

} // namespace

std::string NamespaceTable::resolveRelative(const std::string& base, const std::string& reference)
{
  if (isAbsolute(reference)) {
    return reference;
  }
  if (base.empty()) {
    throw ResolutionError("cannot resolve relative IRI <" + reference + "> without a base");
  }

  // split the base into scheme, authority, path, query (fragment is dropped)
  std::string baseNoFragment = base.substr(0, base.find('#'));
  std::size_t schemeEnd = baseNoFragment.find(':');
  std::string scheme = baseNoFragment.substr(0, schemeEnd + 1);
  std::string rest = baseNoFragment.substr(schemeEnd + 1);
  std::string authority;
  if (rest.compare(0, 2, "//") == 0) {
    std::size_t authorityEnd = rest.find_first_of("/?", 2);
    authority = rest.substr(0, authorityEnd);
    rest = authorityEnd == std::string::npos ? std::string() : rest.substr(authorityEnd);
  }
  std::string basePath = rest.substr(0, rest.find('?'));

  if (reference.empty()) {
    return baseNoFragment;
  }
  switch (reference[0]) {
    case '#':
      return baseNoFragment + reference;
    case '?':
      return scheme + authority + basePath + reference;
    case '/':
      if (reference.compare(0, 2, "//") == 0) {
        return scheme + reference;
      }
      return scheme + authority + removeDotSegments(reference);
  }

  // merge paths
  std::string merged;
  if (!authority.empty() && basePath.empty()) {
    merged = "/" + reference;
  } else {
    std::size_t lastSlash = basePath.rfind('/');
    merged = (lastSlash == std::string::npos ? std::string() : basePath.substr(0, lastSlash + 1)) + reference;
  }

  // keep query/fragment of the reference out of dot segment removal
  std::size_t suffixStart = merged.find_first_of("?#");
  std::string suffix;
  if (suffixStart != std::string::npos) {
    suffix = merged.substr(suffixStart);
    merged = merged.substr(0, suffixStart);
  }
  return scheme + authority + removeDotSegments(merged) + suffix;
}
