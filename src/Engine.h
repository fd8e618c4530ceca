#ifndef ENGINE_H
#define ENGINE_H

#include "Codec.h"
#include "Error.h"
#include "Graph.h"
#include "NamespaceTable.h"
#include "Query.h"
#include "Reasoner.h"
#include "Validator.h"

#include <cstddef> // size_t
#include <memory>
#include <mutex>
#include <string>

struct EngineOptions {
  // prefixes every load and query starts from
  NamespaceTable namespaces = NamespaceTable::defaults();
  Reasoner::RuleSet ruleSet = Reasoner::kCoreRuleSet;
  // add the RDFS axiomatic triples before inferring
  bool axioms = false;
};

struct LoadStats {
  std::size_t triplesParsed = 0;
  std::size_t triplesAdded = 0;
};

// The knowledge base: one graph plus the operations collaborators use.
//
// The graph is held as an immutable snapshot. load() and infer() are
// serialized, work on a private copy and publish it when done, so a failed
// operation leaves the previous graph in place. Readers take the current
// snapshot and never block writers.
class Engine {
public:
  typedef std::shared_ptr<const Graph> Snapshot;

  explicit Engine(const EngineOptions& options = EngineOptions());

  // Decodes text and adds its triples. Either all triples are added or none.
  Result<LoadStats> load(const std::string& text, Format format, const std::string& baseIRI = "");

  Result<QueryResult> query(const std::string& text) const;
  Result<QueryResult> query(const Query& query) const;
  // evaluates against an explicit snapshot, e.g. one taken before infer()
  static Result<QueryResult> query(const Query& query, const Snapshot& snapshot);

  Result<InferenceReport> infer(std::size_t maxIterations = Reasoner::kDefaultMaxIterations);

  Result<ValidationReport> validate(const ShapeVector& shapes) const;
  // shapes given as SHACL in any supported syntax
  Result<ValidationReport> validate(const std::string& shapesText, Format format) const;

  Result<std::string> exportGraph(Format format) const;

  Snapshot snapshot() const;
  Graph::Statistics statistics() const { return snapshot()->statistics(); }
  std::size_t size() const { return snapshot()->size(); }
  // configured prefixes plus those declared by loaded documents
  NamespaceTable namespaces() const;
  const EngineOptions& options() const { return options_; }

private:
  EngineOptions options_;
  Reasoner reasoner_;

  // guards graph_, namespaces_ and loads_
  mutable std::mutex snapshotMutex_;
  // serializes load() and infer()
  std::mutex writerMutex_;

  Snapshot graph_;
  NamespaceTable namespaces_;
  std::size_t loads_ = 0;

  void publish(const Snapshot& graph, const NamespaceTable& declared);
};

#endif
