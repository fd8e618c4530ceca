#include "Engine.h"
#include "QueryEngine.h"
#include "QueryParser.h"

#include <sstream>

Engine::Engine(const EngineOptions& options)
  : options_(options), reasoner_(options.ruleSet), graph_(std::make_shared<Graph>()),
    namespaces_(options.namespaces)
{
}

Engine::Snapshot Engine::snapshot() const
{
  std::lock_guard<std::mutex> lock(snapshotMutex_);
  return graph_;
}

NamespaceTable Engine::namespaces() const
{
  std::lock_guard<std::mutex> lock(snapshotMutex_);
  return namespaces_;
}

void Engine::publish(const Snapshot& graph, const NamespaceTable& declared)
{
  std::lock_guard<std::mutex> lock(snapshotMutex_);
  graph_ = graph;
  namespaces_.merge(declared);
}

////////////////////////////////////////////////////////////////////////////////

Result<LoadStats> Engine::load(const std::string& text, Format format, const std::string& baseIRI)
{
  std::lock_guard<std::mutex> writer(writerMutex_);

  DecodeOptions options;
  // every load starts from the configured prefixes only
  options.namespaces = options_.namespaces;
  options.baseIRI = baseIRI;
  {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    std::ostringstream prefix;
    prefix << "l" << ++loads_ << "b";
    options.blankPrefix = prefix.str();
  }

  Result<DecodeResult> decoded = decode(format, text, options);
  if (!decoded) {
    return decoded.error();
  }

  LoadStats stats;
  std::shared_ptr<Graph> next;
  try {
    next = std::make_shared<Graph>(*snapshot());
    for (const Triple& t : decoded.value().triples) {
      ++stats.triplesParsed;
      if (next->insert(t)) {
        ++stats.triplesAdded;
      }
    }
  } catch (const Error& e) {
    return e;
  }

  publish(next, decoded.value().namespaces);
  return stats;
}

////////////////////////////////////////////////////////////////////////////////

Result<QueryResult> Engine::query(const std::string& text) const
{
  try {
    // document prefixes are usable in queries, configured ones take precedence
    QueryParser parser(namespaces());
    return query(parser.parse(text), snapshot());
  } catch (const Error& e) {
    return e;
  }
}

Result<QueryResult> Engine::query(const Query& q) const
{
  return query(q, snapshot());
}

Result<QueryResult> Engine::query(const Query& q, const Snapshot& snapshot)
{
  try {
    QueryEngine engine(*snapshot);
    return engine.execute(q);
  } catch (const Error& e) {
    return e;
  }
}

////////////////////////////////////////////////////////////////////////////////

Result<InferenceReport> Engine::infer(std::size_t maxIterations)
{
  std::lock_guard<std::mutex> writer(writerMutex_);

  InferenceReport report;
  try {
    std::shared_ptr<Graph> next = std::make_shared<Graph>(*snapshot());
    std::size_t axioms(0);
    if (options_.axioms) {
      axioms = Reasoner::addAxiomaticTriples(*next);
    }
    report = reasoner_.infer(*next, maxIterations);
    report.axiomaticTriples = axioms;
    if (report.triplesAdded || axioms) {
      publish(next, NamespaceTable());
    }
  } catch (const Error& e) {
    return e;
  }
  return report;
}

////////////////////////////////////////////////////////////////////////////////

Result<ValidationReport> Engine::validate(const ShapeVector& shapes) const
{
  try {
    Validator validator(shapes);
    return validator.validate(*snapshot());
  } catch (const Error& e) {
    return e;
  }
}

Result<ValidationReport> Engine::validate(const std::string& shapesText, Format format) const
{
  DecodeOptions options;
  options.namespaces = options_.namespaces;
  options.blankPrefix = "shape";
  Result<DecodeResult> decoded = decode(format, shapesText, options);
  if (!decoded) {
    return decoded.error();
  }

  try {
    Graph shapes;
    for (const Triple& t : decoded.value().triples) {
      shapes.insert(t);
    }
    return validate(ShapeLoader::load(shapes));
  } catch (const Error& e) {
    return e;
  }
}

////////////////////////////////////////////////////////////////////////////////

Result<std::string> Engine::exportGraph(Format format) const
{
  EncodeOptions options;
  options.namespaces = namespaces();
  return encode(format, snapshot()->triples(), options);
}
