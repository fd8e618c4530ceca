#include "Validator.h"
#include "Error.h"
#include "types.h"

#include <cctype>
#include <cstdlib>
#include <set>
#include <sstream>

namespace {

// a short name for sh: and other IRIs in messages
std::string shortName(const std::string& iri)
{
  if (iri.compare(0, kSHNamespace.size(), kSHNamespace) == 0) {
    return "sh:" + iri.substr(kSHNamespace.size());
  }
  return "<" + iri + ">";
}

bool isAnnotation(const std::string& predicate)
{
  return predicate == kSHNameURI || predicate == kSHDescriptionURI || predicate == kSHMessageURI
      || predicate == kSHOrderURI || predicate == kSHGroupURI;
}

std::string kindName(unsigned kinds)
{
  std::string result;
  if (kinds & PropertyConstraint::kNodeKindBlank) {
    result += "BlankNode";
  }
  if (kinds & PropertyConstraint::kNodeKindIRI) {
    result += result.empty() ? "IRI" : "OrIRI";
  }
  if (kinds & PropertyConstraint::kNodeKindLiteral) {
    result += result.empty() ? "Literal" : "OrLiteral";
  }
  return "sh:" + result;
}

}

std::string ValidationReport::toString() const
{
  std::ostringstream out;
  for (const Violation& v : violations) {
    out << v.focusNode << " " << v.constraint << ": " << v.message << "\n";
  }
  return out.str();
}

////////////////////////////////////////////////////////////////////////////////

ShapeVector ShapeLoader::load(const Graph& shapes)
{
  // node shapes are typed sh:NodeShape or carry a target
  std::set<Term> nodes;
  Term type = Term::iri(kTypeURI);
  Graph::Cursor typed = shapes.match(boost::none, type, Term::iri(kSHNodeShapeURI));
  Triple t;
  while (typed.next(t)) {
    nodes.insert(t.subject);
  }
  Graph::Cursor targeted = shapes.match(boost::none, Term::iri(kSHTargetClassURI), boost::none);
  while (targeted.next(t)) {
    nodes.insert(t.subject);
  }

  ShapeVector result;
  for (const Term& node : nodes) {
    result.push_back(loadShape(shapes, node));
  }
  return result;
}

Shape ShapeLoader::loadShape(const Graph& shapes, const Term& node)
{
  Shape shape;
  shape.iri = node;
  shape.targetClasses = values(shapes, node, kSHTargetClassURI);
  if (shape.targetClasses.empty()) {
    throw ValidationError("shape " + node.toString() + " has no sh:targetClass");
  }
  for (const Term& target : shape.targetClasses) {
    if (!target.isIRI()) {
      throw ValidationError("sh:targetClass of " + node.toString() + " must be an IRI");
    }
  }

  for (const Term& property : values(shapes, node, kSHPropertyURI)) {
    if (!property.isResource()) {
      throw ValidationError("sh:property of " + node.toString() + " must be a node");
    }
    shape.properties.push_back(loadProperty(shapes, property));
  }

  std::set<std::string> unsupported;
  Graph::Cursor cursor = shapes.match(node, boost::none, boost::none);
  Triple t;
  while (cursor.next(t)) {
    const std::string& p = t.predicate.value();
    if (p.compare(0, kSHNamespace.size(), kSHNamespace) != 0) {
      continue;
    }
    if (p == kSHTargetClassURI || p == kSHPropertyURI || isAnnotation(p)) {
      continue;
    }
    unsupported.insert(p);
  }
  shape.unsupported.assign(unsupported.begin(), unsupported.end());
  return shape;
}

PropertyConstraint ShapeLoader::loadProperty(const Graph& shapes, const Term& node)
{
  boost::optional<Term> path = single(shapes, node, kSHPathURI);
  if (!path) {
    throw ValidationError("property shape " + node.toString() + " has no sh:path");
  }
  if (!path->isIRI()) {
    throw ValidationError("sh:path of " + node.toString() + " must be an IRI");
  }
  PropertyConstraint constraint(*path);

  if (boost::optional<Term> value = single(shapes, node, kSHMinCountURI)) {
    constraint.minCount = count(*value, node, "sh:minCount");
  }
  if (boost::optional<Term> value = single(shapes, node, kSHMaxCountURI)) {
    constraint.maxCount = count(*value, node, "sh:maxCount");
  }
  if (constraint.minCount && constraint.maxCount && *constraint.minCount > *constraint.maxCount) {
    throw ValidationError("sh:minCount exceeds sh:maxCount in " + node.toString());
  }

  if (boost::optional<Term> value = single(shapes, node, kSHDatatypeURI)) {
    if (!value->isIRI()) {
      throw ValidationError("sh:datatype of " + node.toString() + " must be an IRI");
    }
    constraint.datatype = value->value();
  }
  if (boost::optional<Term> value = single(shapes, node, kSHClassURI)) {
    if (!value->isIRI()) {
      throw ValidationError("sh:class of " + node.toString() + " must be an IRI");
    }
    constraint.classIri = value->value();
  }
  if (boost::optional<Term> value = single(shapes, node, kSHNodeKindURI)) {
    constraint.nodeKind = nodeKind(*value, node);
  }
  if (boost::optional<Term> value = single(shapes, node, kSHMessageURI)) {
    constraint.message = value->value();
  }

  std::set<std::string> unsupported;
  Graph::Cursor cursor = shapes.match(node, boost::none, boost::none);
  Triple t;
  while (cursor.next(t)) {
    const std::string& p = t.predicate.value();
    if (p.compare(0, kSHNamespace.size(), kSHNamespace) != 0 || isAnnotation(p)) {
      continue;
    }
    if (p == kSHPathURI || p == kSHMinCountURI || p == kSHMaxCountURI || p == kSHDatatypeURI
        || p == kSHClassURI || p == kSHNodeKindURI) {
      continue;
    }
    unsupported.insert(p);
  }
  constraint.unsupported.assign(unsupported.begin(), unsupported.end());
  return constraint;
}

std::vector<Term> ShapeLoader::values(const Graph& graph, const Term& subject, const std::string& predicate)
{
  std::vector<Term> result;
  Graph::Cursor cursor = graph.match(subject, Term::iri(predicate), boost::none);
  Triple t;
  while (cursor.next(t)) {
    result.push_back(t.object);
  }
  return result;
}

boost::optional<Term> ShapeLoader::single(const Graph& graph, const Term& subject, const std::string& predicate)
{
  std::vector<Term> all = values(graph, subject, predicate);
  if (all.empty()) {
    return boost::none;
  }
  if (all.size() > 1) {
    throw ValidationError(subject.toString() + " has more than one " + shortName(predicate));
  }
  return all.front();
}

std::size_t ShapeLoader::count(const Term& value, const Term& node, const char* name)
{
  const std::string& lexical = value.value();
  bool digits = value.isLiteral() && !lexical.empty();
  for (std::size_t i(0); digits && i != lexical.size(); ++i) {
    char c = lexical[i];
    digits = std::isdigit(static_cast<unsigned char>(c)) || (i == 0 && c == '+' && lexical.size() > 1);
  }
  if (!digits) {
    throw ValidationError(std::string(name) + " of " + node.toString()
                          + " must be a non-negative integer, found " + value.toString());
  }
  return static_cast<std::size_t>(std::strtoull(lexical.c_str(), nullptr, 10));
}

unsigned ShapeLoader::nodeKind(const Term& value, const Term& node)
{
  const std::string& kind = value.value();
  if (value.isIRI()) {
    if (kind == kSHIRIURI) {
      return PropertyConstraint::kNodeKindIRI;
    } else if (kind == kSHBlankNodeURI) {
      return PropertyConstraint::kNodeKindBlank;
    } else if (kind == kSHLiteralURI) {
      return PropertyConstraint::kNodeKindLiteral;
    } else if (kind == kSHBlankNodeOrIRIURI) {
      return PropertyConstraint::kNodeKindBlank | PropertyConstraint::kNodeKindIRI;
    } else if (kind == kSHBlankNodeOrLiteralURI) {
      return PropertyConstraint::kNodeKindBlank | PropertyConstraint::kNodeKindLiteral;
    } else if (kind == kSHIRIOrLiteralURI) {
      return PropertyConstraint::kNodeKindIRI | PropertyConstraint::kNodeKindLiteral;
    }
  }
  throw ValidationError("unknown sh:nodeKind " + value.toString() + " in " + node.toString());
}

////////////////////////////////////////////////////////////////////////////////

ValidationReport Validator::validate(const Graph& data) const
{
  ValidationReport report;

  for (const Shape& shape : shapes_) {
    std::vector<Term> classes;
    for (const Term& target : shape.targetClasses) {
      std::vector<Term> sub = subClasses(data, target);
      classes.insert(classes.end(), sub.begin(), sub.end());
    }

    std::set<Term> focusNodes;
    Term type = Term::iri(kTypeURI);
    for (const Term& cls : classes) {
      Graph::Cursor cursor = data.match(boost::none, type, cls);
      Triple t;
      while (cursor.next(t)) {
        focusNodes.insert(t.subject);
      }
    }

    for (const Term& focus : focusNodes) {
      // fail closed on constraints we cannot check
      for (const std::string& constraint : shape.unsupported) {
        Violation v;
        v.focusNode = focus;
        v.constraint = shortName(constraint);
        v.message = "unsupported constraint " + shortName(constraint);
        v.shape = shape.iri;
        report.violations.push_back(v);
      }
      for (const PropertyConstraint& property : shape.properties) {
        validateProperty(data, shape, focus, property, report);
      }
    }
  }

  report.conforms = report.violations.empty();
  return report;
}

void Validator::validateProperty(const Graph& data, const Shape& shape, const Term& focus,
                                 const PropertyConstraint& property, ValidationReport& report) const
{
  std::vector<Term> values;
  Graph::Cursor cursor = data.match(focus, property.path, boost::none);
  Triple t;
  while (cursor.next(t)) {
    values.push_back(t.object);
  }

  auto violation = [&](const std::string& constraint, const std::string& message) {
    Violation v;
    v.focusNode = focus;
    v.constraint = constraint;
    v.message = property.message.empty() ? message : property.message;
    v.shape = shape.iri;
    v.path = property.path;
    report.violations.push_back(v);
  };
  const std::string path = property.path.toString();

  for (const std::string& constraint : property.unsupported) {
    violation(shortName(constraint), "unsupported constraint " + shortName(constraint) + " on " + path);
  }

  if (property.minCount && values.size() < *property.minCount) {
    std::ostringstream message;
    message << "expected at least " << *property.minCount << " value(s) for " << path
            << ", found " << values.size();
    violation("sh:minCount", message.str());
  }
  if (property.maxCount && values.size() > *property.maxCount) {
    std::ostringstream message;
    message << "expected at most " << *property.maxCount << " value(s) for " << path
            << ", found " << values.size();
    violation("sh:maxCount", message.str());
  }

  std::vector<Term> classes;
  if (property.classIri) {
    classes = subClasses(data, Term::iri(*property.classIri));
  }

  for (const Term& value : values) {
    if (property.datatype) {
      std::string datatype = value.hasLanguage() ? kLangStringURI
          : (value.hasDatatype() ? value.datatype() : kXSDStringURI);
      if (!value.isLiteral() || datatype != *property.datatype) {
        violation("sh:datatype", "value " + value.toString() + " of " + path
                  + " is not of datatype <" + *property.datatype + ">");
      }
    }
    if (property.classIri && !hasClass(data, value, classes)) {
      violation("sh:class", "value " + value.toString() + " of " + path
                + " is not an instance of <" + *property.classIri + ">");
    }
    if (property.nodeKind) {
      unsigned kind = value.isIRI() ? PropertyConstraint::kNodeKindIRI
          : (value.isBlank() ? PropertyConstraint::kNodeKindBlank : PropertyConstraint::kNodeKindLiteral);
      if (!(kind & *property.nodeKind)) {
        violation("sh:nodeKind", "value " + value.toString() + " of " + path
                  + " is not a " + kindName(*property.nodeKind));
      }
    }
  }
}

bool Validator::hasClass(const Graph& data, const Term& node, const std::vector<Term>& classes)
{
  if (node.isLiteral()) {
    return false;
  }
  Term type = Term::iri(kTypeURI);
  for (const Term& cls : classes) {
    if (data.contains(Triple(node, type, cls))) {
      return true;
    }
  }
  return false;
}

// cls and its transitive subclasses, cls first
std::vector<Term> Validator::subClasses(const Graph& data, const Term& cls)
{
  std::vector<Term> result(1, cls);
  std::set<Term> seen(result.begin(), result.end());
  Term subClassOf = Term::iri(kSubClassOfURI);
  for (std::size_t i(0); i != result.size(); ++i) {
    Graph::Cursor cursor = data.match(boost::none, subClassOf, result[i]);
    Triple t;
    while (cursor.next(t)) {
      if (seen.insert(t.subject).second) {
        result.push_back(t.subject);
      }
    }
  }
  return result;
}
