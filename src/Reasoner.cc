#include "Reasoner.h"
#include "types.h"

#include <set>

const std::size_t Reasoner::kDefaultMaxIterations;

Reasoner::Reasoner(RuleSet ruleSet) : ruleSet_(ruleSet)
{
  rules_.push_back(std::unique_ptr<Rule>(new SubClassTransitivityRule));
  rules_.push_back(std::unique_ptr<Rule>(new SubPropertyTransitivityRule));
  rules_.push_back(std::unique_ptr<Rule>(new TypeInheritanceRule));

  if (ruleSet_ == kRhoDFRuleSet) {
    rules_.push_back(std::unique_ptr<Rule>(new DomainRule));
    rules_.push_back(std::unique_ptr<Rule>(new RangeRule));
    rules_.push_back(std::unique_ptr<Rule>(new SubPropertyInheritanceRule));
  }
}

InferenceReport Reasoner::infer(Graph& graph, std::size_t maxIterations) const
{
  InferenceReport report;
  Vocabulary vocabulary = Vocabulary::intern(graph);

  while (report.roundsRun < maxIterations) {
    // derive everything from the current state before inserting anything
    IdTripleVector derived;
    for (auto it(std::begin(rules_)); it != std::end(rules_); ++it) {
      (*it)->apply(graph, vocabulary, derived);
    }

    std::size_t added(0);
    for (const Graph::IdTriple& t : derived) {
      if (graph.addTriple(t)) {
        ++added;
      }
    }

    ++report.roundsRun;
    report.perRound.push_back(added);
    report.triplesAdded += added;

    if (!added) {
      report.fixpointReached = true;
      break;
    }
  }

  return report;
}

Graph Reasoner::closure(const Graph& graph, InferenceReport& report, std::size_t maxIterations) const
{
  Graph result(graph);
  report = infer(result, maxIterations);
  return result;
}

////////////////////////////////////////////////////////////////////////////////

std::size_t Reasoner::addAxiomaticTriples(Graph& graph)
{
  Term type = Term::iri(kTypeURI);
  Term subClassOf = Term::iri(kSubClassOfURI);
  Term subPropertyOf = Term::iri(kSubPropertyOfURI);
  Term domain = Term::iri(kDomainURI);
  Term range = Term::iri(kRangeURI);

  Term Resource = Term::iri(kResourceURI);
  Term Property = Term::iri(kPropertyURI);
  Term Class = Term::iri(kClassURI);
  Term Literal = Term::iri(kLiteralURI);
  Term Statement = Term::iri(kStatementURI);
  Term Container = Term::iri(kContainerURI);
  Term ContainerMembershipProperty = Term::iri(kConMemShipPropURI);

  Term member = Term::iri(kMemberURI);
  Term seeAlso = Term::iri(kSeeAlsoURI);
  Term isDefinedBy = Term::iri(kIsDefinedByURI);
  Term comment = Term::iri(kCommentURI);
  Term label = Term::iri(kLabelURI);

  Term subject = Term::iri(kSubjectURI);
  Term predicate = Term::iri(kPredicateURI);
  Term object = Term::iri(kObjectURI);
  Term first = Term::iri(kFirstURI);
  Term rest = Term::iri(kRestURI);
  Term value = Term::iri(kValueURI);

  Term List = Term::iri(kListURI);
  Term Alt = Term::iri(kAltURI);
  Term Bag = Term::iri(kBagURI);
  Term Seq = Term::iri(kSeqURI);
  Term XMLLiteral = Term::iri(kXMLLiteralURI);
  Term Datatype = Term::iri(kDatatypeURI);

  // container membership properties in use, collected before the graph grows
  static const std::string rdfMemberPrefix = kRDFNamespace + "_";
  std::set<Term> membershipProperties;
  for (auto it(graph.begin()); it != graph.end(); ++it) {
    const Term& p = graph.term(it->predicate);
    if (p.value().size() > rdfMemberPrefix.size()
        && p.value().compare(0, rdfMemberPrefix.size(), rdfMemberPrefix) == 0) {
      membershipProperties.insert(p);
    }
  }

  std::size_t added(0);
  auto add = [&graph, &added](const Term& s, const Term& p, const Term& o) {
    if (graph.insert(s, p, o)) {
      ++added;
    }
  };

  add(type, domain, Resource);
  add(domain, domain, Property);
  add(range, domain, Property);
  add(subPropertyOf, domain, Property);
  add(subClassOf, domain, Class);
  add(subject, domain, Statement);
  add(predicate, domain, Statement);
  add(object, domain, Statement);
  add(member, domain, Resource);
  add(first, domain, List);
  add(rest, domain, List);
  add(seeAlso, domain, Resource);
  add(isDefinedBy, domain, Resource);
  add(comment, domain, Resource);
  add(label, domain, Resource);
  add(value, domain, Resource);

  add(type, range, Class);
  add(domain, range, Class);
  add(range, range, Class);
  add(subPropertyOf, range, Property);
  add(subClassOf, range, Class);
  add(subject, range, Resource);
  add(predicate, range, Resource);
  add(object, range, Resource);
  add(member, range, Resource);
  add(first, range, Resource);
  add(rest, range, List);
  add(seeAlso, range, Resource);
  add(isDefinedBy, range, Resource);
  add(comment, range, Literal);
  add(label, range, Literal);
  add(value, range, Resource);

  add(Alt, subClassOf, Container);
  add(Bag, subClassOf, Container);
  add(Seq, subClassOf, Container);
  add(ContainerMembershipProperty, subClassOf, Property);

  add(XMLLiteral, type, Datatype);
  add(XMLLiteral, subClassOf, Literal);
  add(Datatype, subClassOf, Class);

  // finite axiomatic triples for container membership properties
  for (const Term& membershipProperty : membershipProperties) {
    add(membershipProperty, type, ContainerMembershipProperty);
    add(membershipProperty, domain, Resource);
    add(membershipProperty, range, Resource);
  }

  return added;
}
