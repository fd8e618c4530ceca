#ifndef VALIDATOR_H
#define VALIDATOR_H

#include "Graph.h"
#include "Term.h"

#include <cstddef> // size_t
#include <string>
#include <vector>
#include <boost/optional.hpp>

// Constraints on the values of one property of a focus node
struct PropertyConstraint {
  // allowed node kinds, sh:nodeKind
  enum NodeKindFlags {
    kNodeKindIRI     = 1 << 0,
    kNodeKindBlank   = 1 << 1,
    kNodeKindLiteral = 1 << 2
  };

  Term path;
  boost::optional<std::size_t> minCount;
  boost::optional<std::size_t> maxCount;
  boost::optional<std::string> datatype;
  boost::optional<std::string> classIri;
  boost::optional<unsigned> nodeKind;
  // sh:message, replaces the generated message
  std::string message;
  // constraint predicates the validator does not implement
  std::vector<std::string> unsupported;

  PropertyConstraint() {}
  explicit PropertyConstraint(const Term& p) : path(p) {}
};

struct Shape {
  Term iri;
  std::vector<Term> targetClasses;
  std::vector<PropertyConstraint> properties;
  std::vector<std::string> unsupported;
};

typedef std::vector<Shape> ShapeVector;

struct Violation {
  Term focusNode;
  // sh:minCount, sh:datatype, ... or the unsupported predicate
  std::string constraint;
  std::string message;
  Term shape;
  // empty for shape level violations
  Term path;
};

struct ValidationReport {
  bool conforms = true;
  std::vector<Violation> violations;

  // one line per violation
  std::string toString() const;
};

// Reads SHACL node shapes from a graph.
// Supports sh:targetClass, sh:property, sh:path (predicate paths),
// sh:minCount, sh:maxCount, sh:datatype, sh:class and sh:nodeKind.
// Other sh: constraints are kept as unsupported; malformed shapes throw
// ValidationError.
class ShapeLoader {
public:
  static ShapeVector load(const Graph& shapes);

private:
  static Shape loadShape(const Graph& shapes, const Term& node);
  static PropertyConstraint loadProperty(const Graph& shapes, const Term& node);
  static std::vector<Term> values(const Graph& graph, const Term& subject, const std::string& predicate);
  static boost::optional<Term> single(const Graph& graph, const Term& subject, const std::string& predicate);
  static std::size_t count(const Term& value, const Term& node, const char* name);
  static unsigned nodeKind(const Term& value, const Term& node);
};

// Checks a data graph against shapes. Never modifies the graph.
// Instances of subclasses (rdfs:subClassOf in the data) are targeted too.
class Validator {
public:
  explicit Validator(const ShapeVector& shapes) : shapes_(shapes) {}

  ValidationReport validate(const Graph& data) const;

private:
  ShapeVector shapes_;

  void validateProperty(const Graph& data, const Shape& shape, const Term& focus,
                        const PropertyConstraint& property, ValidationReport& report) const;
  static bool hasClass(const Graph& data, const Term& node, const std::vector<Term>& classes);
  static std::vector<Term> subClasses(const Graph& data, const Term& cls);
};

#endif
