#ifndef TYPES_H
#define TYPES_H

#include <cstdint>
#include <string>

// Type for interned RDF term IDs
typedef uint64_t term_id;

// Namespaces
const std::string kRDFNamespace      = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
const std::string kRDFSNamespace     = "http://www.w3.org/2000/01/rdf-schema#";
const std::string kOWLNamespace      = "http://www.w3.org/2002/07/owl#";
const std::string kXSDNamespace      = "http://www.w3.org/2001/XMLSchema#";
const std::string kSHNamespace       = "http://www.w3.org/ns/shacl#";
const std::string kXMLNamespace      = "http://www.w3.org/XML/1998/namespace";

// Schema properties
const std::string kSubClassOfURI     = "http://www.w3.org/2000/01/rdf-schema#subClassOf";
const std::string kSubPropertyOfURI  = "http://www.w3.org/2000/01/rdf-schema#subPropertyOf";
const std::string kDomainURI         = "http://www.w3.org/2000/01/rdf-schema#domain";
const std::string kRangeURI          = "http://www.w3.org/2000/01/rdf-schema#range";
const std::string kTypeURI           = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";

const std::string kResourceURI       = "http://www.w3.org/2000/01/rdf-schema#Resource";
const std::string kPropertyURI       = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Property";
const std::string kClassURI          = "http://www.w3.org/2000/01/rdf-schema#Class";
const std::string kLiteralURI        = "http://www.w3.org/2000/01/rdf-schema#Literal";
const std::string kStatementURI      = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Statement";
const std::string kContainerURI      = "http://www.w3.org/2000/01/rdf-schema#Container";
const std::string kConMemShipPropURI = "http://www.w3.org/2000/01/rdf-schema#ContainerMembershipProperty";

const std::string kMemberURI         = "http://www.w3.org/2000/01/rdf-schema#member";
const std::string kSeeAlsoURI        = "http://www.w3.org/2000/01/rdf-schema#seeAlso";
const std::string kIsDefinedByURI    = "http://www.w3.org/2000/01/rdf-schema#isDefinedBy";
const std::string kCommentURI        = "http://www.w3.org/2000/01/rdf-schema#comment";
const std::string kLabelURI          = "http://www.w3.org/2000/01/rdf-schema#label";

const std::string kSubjectURI        = "http://www.w3.org/1999/02/22-rdf-syntax-ns#subject";
const std::string kPredicateURI      = "http://www.w3.org/1999/02/22-rdf-syntax-ns#predicate";
const std::string kObjectURI         = "http://www.w3.org/1999/02/22-rdf-syntax-ns#object";
const std::string kFirstURI          = "http://www.w3.org/1999/02/22-rdf-syntax-ns#first";
const std::string kRestURI           = "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest";
const std::string kNilURI            = "http://www.w3.org/1999/02/22-rdf-syntax-ns#nil";
const std::string kValueURI          = "http://www.w3.org/1999/02/22-rdf-syntax-ns#value";

const std::string kListURI           = "http://www.w3.org/1999/02/22-rdf-syntax-ns#List";
const std::string kAltURI            = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Alt";
const std::string kBagURI            = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Bag";
const std::string kSeqURI            = "http://www.w3.org/1999/02/22-rdf-syntax-ns#Seq";
const std::string kXMLLiteralURI     = "http://www.w3.org/1999/02/22-rdf-syntax-ns#XMLLiteral";
const std::string kLangStringURI     = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
const std::string kDatatypeURI       = "http://www.w3.org/2000/01/rdf-schema#Datatype";

const std::string kOWLClassURI       = "http://www.w3.org/2002/07/owl#Class";
const std::string kOWLOntologyURI    = "http://www.w3.org/2002/07/owl#Ontology";
const std::string kOWLObjectPropURI  = "http://www.w3.org/2002/07/owl#ObjectProperty";
const std::string kOWLDataPropURI    = "http://www.w3.org/2002/07/owl#DatatypeProperty";

// XML Schema datatypes
const std::string kXSDStringURI      = "http://www.w3.org/2001/XMLSchema#string";
const std::string kXSDIntegerURI     = "http://www.w3.org/2001/XMLSchema#integer";
const std::string kXSDDecimalURI     = "http://www.w3.org/2001/XMLSchema#decimal";
const std::string kXSDDoubleURI      = "http://www.w3.org/2001/XMLSchema#double";
const std::string kXSDBooleanURI     = "http://www.w3.org/2001/XMLSchema#boolean";

// SHACL vocabulary understood by the validator
const std::string kSHNodeShapeURI    = "http://www.w3.org/ns/shacl#NodeShape";
const std::string kSHTargetClassURI  = "http://www.w3.org/ns/shacl#targetClass";
const std::string kSHPropertyURI     = "http://www.w3.org/ns/shacl#property";
const std::string kSHPathURI         = "http://www.w3.org/ns/shacl#path";
const std::string kSHMinCountURI     = "http://www.w3.org/ns/shacl#minCount";
const std::string kSHMaxCountURI     = "http://www.w3.org/ns/shacl#maxCount";
const std::string kSHDatatypeURI     = "http://www.w3.org/ns/shacl#datatype";
const std::string kSHClassURI        = "http://www.w3.org/ns/shacl#class";
const std::string kSHNodeKindURI     = "http://www.w3.org/ns/shacl#nodeKind";
const std::string kSHDescriptionURI  = "http://www.w3.org/ns/shacl#description";
const std::string kSHOrderURI        = "http://www.w3.org/ns/shacl#order";
const std::string kSHGroupURI        = "http://www.w3.org/ns/shacl#group";
const std::string kSHNameURI         = "http://www.w3.org/ns/shacl#name";
const std::string kSHMessageURI      = "http://www.w3.org/ns/shacl#message";
const std::string kSHIRIURI          = "http://www.w3.org/ns/shacl#IRI";
const std::string kSHBlankNodeURI    = "http://www.w3.org/ns/shacl#BlankNode";
const std::string kSHLiteralURI      = "http://www.w3.org/ns/shacl#Literal";
const std::string kSHBlankNodeOrIRIURI     = "http://www.w3.org/ns/shacl#BlankNodeOrIRI";
const std::string kSHBlankNodeOrLiteralURI = "http://www.w3.org/ns/shacl#BlankNodeOrLiteral";
const std::string kSHIRIOrLiteralURI       = "http://www.w3.org/ns/shacl#IRIOrLiteral";

#endif
