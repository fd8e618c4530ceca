#ifndef REASONER_H
#define REASONER_H

#include "Graph.h"
#include "Rule.h"

#include <cstddef> // size_t
#include <memory>
#include <vector>

struct InferenceReport {
  std::size_t roundsRun = 0;
  std::size_t triplesAdded = 0;
  // true once a round derived nothing new
  bool fixpointReached = false;
  // new triples per round
  std::vector<std::size_t> perRound;
  // RDFS axioms added before the first round
  std::size_t axiomaticTriples = 0;
};

// Forward-chaining RDFS reasoner.
// Each round applies every rule to the graph as it was at the start of the
// round, then inserts the derived triples. Rounds repeat until one adds
// nothing or the round cap is reached.
class Reasoner
{
public:
  enum RuleSet {
    kCoreRuleSet,  // rdfs5, rdfs9, rdfs11
    kRhoDFRuleSet  // core + rdfs2, rdfs3, rdfs7
  };

  static const std::size_t kDefaultMaxIterations = 64;

  explicit Reasoner(RuleSet ruleSet = kCoreRuleSet);

  RuleSet ruleSet() const { return ruleSet_; }
  std::size_t ruleCount() const { return rules_.size(); }

  // Computes the closure in place.
  InferenceReport infer(Graph& graph, std::size_t maxIterations = kDefaultMaxIterations) const;
  // Returns the closure as a new graph, graph is left unchanged.
  Graph closure(const Graph& graph, InferenceReport& report,
                std::size_t maxIterations = kDefaultMaxIterations) const;

  // Adds the finite RDFS axiomatic triples, returns how many were new.
  static std::size_t addAxiomaticTriples(Graph& graph);

private:
  RuleSet ruleSet_;
  std::vector<std::unique_ptr<Rule>> rules_;
};

#endif
