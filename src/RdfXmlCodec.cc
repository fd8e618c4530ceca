#include "RdfXmlCodec.h"
#include "types.h"

#include <cctype>
#include <cstring>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <vector>
#include <libxml/parser.h>
#include <libxml/SAX2.h>

namespace {

class RdfXmlParser {
public:
  RdfXmlParser(const DecodeOptions& options);
  DecodeResult parse(const std::string& text);

private:
  enum FrameType {
    kRootFrame,
    kNodeFrame,
    kPropertyFrame
  };

  struct Frame {
    FrameType type;
    Term subject;        // node frames
    Term predicate;      // property frames
    std::string base;
    std::string lang;
    std::string datatype;
    std::string text;
    bool hasNode = false;
    // property element that already has its object (rdf:resource, rdf:nodeID)
    bool empty = false;
    std::size_t liCounter = 0;
  };

  struct Attribute {
    std::string ns;
    std::string local;
    std::string value;
  };
  typedef std::vector<Attribute> AttributeVector;

  std::string base_;
  BlankNodeLabeler blanks_;
  std::vector<Frame> stack_;
  DecodeResult result_;
  xmlSAXHandler sax_;
  std::unique_ptr<xmlParserCtxt, decltype(&xmlFreeParserCtxt)> ctxt_;

  // first error seen inside a callback, rethrown after parsing
  bool failed_ = false;
  Error::Kind errorKind_ = Error::kParseError;
  std::string errorReason_;
  std::size_t errorLine_ = 0;
  std::size_t errorColumn_ = 0;

  static void onStartElement(void* ctx, const xmlChar* localname, const xmlChar* prefix,
                             const xmlChar* URI, int nb_namespaces, const xmlChar** namespaces,
                             int nb_attributes, int nb_defaulted, const xmlChar** attributes);
  static void onEndElement(void* ctx, const xmlChar* localname, const xmlChar* prefix, const xmlChar* URI);
  static void onCharacters(void* ctx, const xmlChar* ch, int len);
  static void onError(void* ctx, xmlErrorPtr error);

  void startElement(const std::string& ns, const std::string& local, const AttributeVector& attributes);
  void endElement();
  void characters(const char* ch, int len);

  void startNode(const std::string& elementIRI, const AttributeVector& attributes, Frame frame);
  void startProperty(const std::string& elementIRI, const AttributeVector& attributes, Frame frame);

  std::string resolve(const std::string& base, const std::string& iri);
  void emit(const Term& s, const Term& p, const Term& o) { result_.triples.push_back(Triple(s, p, o)); }
  void fail(const Error& error);

  static bool isWhitespace(const std::string& text);
  static bool isSyntaxAttribute(const Attribute& a);
  static const Attribute* find(const AttributeVector& attributes, const std::string& ns, const char* local);
};

RdfXmlParser::RdfXmlParser(const DecodeOptions& options)
  : base_(options.baseIRI), blanks_(options.blankPrefix), ctxt_(nullptr, &xmlFreeParserCtxt)
{
  std::memset(&sax_, 0, sizeof(sax_));
  sax_.initialized = XML_SAX2_MAGIC;
  sax_.startElementNs = &RdfXmlParser::onStartElement;
  sax_.endElementNs = &RdfXmlParser::onEndElement;
  sax_.characters = &RdfXmlParser::onCharacters;
  sax_.serror = &RdfXmlParser::onError;
}

DecodeResult RdfXmlParser::parse(const std::string& text)
{
  ctxt_.reset(xmlCreatePushParserCtxt(&sax_, this, nullptr, 0, nullptr));
  if (!ctxt_) {
    throw ParseError("could not create XML parser");
  }
  xmlCtxtUseOptions(ctxt_.get(), XML_PARSE_NONET | XML_PARSE_NOENT);

  int status = xmlParseChunk(ctxt_.get(), text.data(), static_cast<int>(text.size()), 1);
  if (failed_ && errorKind_ == Error::kResolutionError) {
    throw ResolutionError(errorReason_, errorLine_, errorColumn_);
  }
  if (failed_) {
    throw ParseError(errorReason_, errorLine_, errorColumn_);
  }
  if (status != 0) {
    throw ParseError("malformed XML document");
  }
  return result_;
}

void RdfXmlParser::onStartElement(void* ctx, const xmlChar* localname, const xmlChar*,
                                  const xmlChar* URI, int nb_namespaces, const xmlChar** namespaces,
                                  int nb_attributes, int, const xmlChar** attributes)
{
  RdfXmlParser* self = static_cast<RdfXmlParser*>(ctx);
  if (self->failed_) {
    return;
  }

  // remember declared namespaces as serialization hints
  for (int i(0); i != nb_namespaces; ++i) {
    const xmlChar* prefix = namespaces[2 * i];
    const xmlChar* uri = namespaces[2 * i + 1];
    if (prefix && uri) {
      self->result_.namespaces.add(reinterpret_cast<const char*>(prefix), reinterpret_cast<const char*>(uri));
    }
  }

  AttributeVector attrs;
  for (int i(0); i != nb_attributes; ++i) {
    const xmlChar** a = attributes + 5 * i;
    Attribute attribute;
    attribute.local = reinterpret_cast<const char*>(a[0]);
    attribute.ns = a[2] ? reinterpret_cast<const char*>(a[2]) : "";
    attribute.value.assign(reinterpret_cast<const char*>(a[3]), reinterpret_cast<const char*>(a[4]));
    attrs.push_back(attribute);
  }

  try {
    self->startElement(URI ? reinterpret_cast<const char*>(URI) : "",
                       reinterpret_cast<const char*>(localname), attrs);
  } catch (const Error& e) {
    // exceptions must not cross the C parser
    self->fail(e);
  }
}

void RdfXmlParser::onEndElement(void* ctx, const xmlChar*, const xmlChar*, const xmlChar*)
{
  RdfXmlParser* self = static_cast<RdfXmlParser*>(ctx);
  if (self->failed_) {
    return;
  }
  try {
    self->endElement();
  } catch (const Error& e) {
    self->fail(e);
  }
}

void RdfXmlParser::onCharacters(void* ctx, const xmlChar* ch, int len)
{
  RdfXmlParser* self = static_cast<RdfXmlParser*>(ctx);
  if (self->failed_) {
    return;
  }
  self->characters(reinterpret_cast<const char*>(ch), len);
}

void RdfXmlParser::onError(void* ctx, xmlErrorPtr error)
{
  RdfXmlParser* self = static_cast<RdfXmlParser*>(ctx);
  if (self->failed_ || !error || error->level < XML_ERR_ERROR) {
    return;
  }
  self->failed_ = true;
  self->errorReason_ = error->message ? error->message : "malformed XML";
  // libxml2 messages end with a newline
  while (!self->errorReason_.empty() && std::isspace(static_cast<unsigned char>(self->errorReason_.back()))) {
    self->errorReason_.pop_back();
  }
  self->errorLine_ = error->line > 0 ? static_cast<std::size_t>(error->line) : 0;
  self->errorColumn_ = error->int2 > 0 ? static_cast<std::size_t>(error->int2) : 0;
}

void RdfXmlParser::fail(const Error& error)
{
  if (failed_) {
    return;
  }
  failed_ = true;
  errorKind_ = error.kind();
  errorReason_ = error.reason();
  if (ctxt_) {
    errorLine_ = static_cast<std::size_t>(xmlSAX2GetLineNumber(ctxt_.get()));
    errorColumn_ = static_cast<std::size_t>(xmlSAX2GetColumnNumber(ctxt_.get()));
    xmlStopParser(ctxt_.get());
  }
}

////////////////////////////////////////////////////////////////////////////////

const RdfXmlParser::Attribute* RdfXmlParser::find(const AttributeVector& attributes,
                                                  const std::string& ns, const char* local)
{
  for (const Attribute& a : attributes) {
    if (a.ns == ns && a.local == local) {
      return &a;
    }
  }
  return nullptr;
}

bool RdfXmlParser::isSyntaxAttribute(const Attribute& a)
{
  if (a.ns == kXMLNamespace) {
    return true;
  }
  if (a.ns != kRDFNamespace) {
    // unqualified attributes are reserved
    return a.ns.empty();
  }
  return a.local == "about" || a.local == "ID" || a.local == "nodeID" || a.local == "resource"
      || a.local == "datatype" || a.local == "parseType" || a.local == "aboutEach"
      || a.local == "aboutEachPrefix" || a.local == "bagID";
}

bool RdfXmlParser::isWhitespace(const std::string& text)
{
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string RdfXmlParser::resolve(const std::string& base, const std::string& iri)
{
  if (NamespaceTable::isAbsolute(iri)) {
    return iri;
  }
  return NamespaceTable::resolveRelative(base, iri);
}

void RdfXmlParser::startElement(const std::string& ns, const std::string& local,
                                const AttributeVector& attributes)
{
  if (ns.empty()) {
    throw ParseError("element <" + local + "> has no namespace");
  }
  std::string elementIRI = ns + local;

  Frame frame;
  frame.base = stack_.empty() ? base_ : stack_.back().base;
  frame.lang = stack_.empty() ? std::string() : stack_.back().lang;
  if (const Attribute* xmlBase = find(attributes, kXMLNamespace, "base")) {
    frame.base = resolve(frame.base, xmlBase->value);
  }
  if (const Attribute* xmlLang = find(attributes, kXMLNamespace, "lang")) {
    frame.lang = xmlLang->value;
  }

  if (stack_.empty()) {
    if (elementIRI == kRDFNamespace + "RDF") {
      frame.type = kRootFrame;
      stack_.push_back(frame);
    } else {
      startNode(elementIRI, attributes, frame);
    }
    return;
  }

  Frame& parent = stack_.back();
  switch (parent.type) {
    case kRootFrame:
      startNode(elementIRI, attributes, frame);
      break;
    case kNodeFrame:
      startProperty(elementIRI, attributes, frame);
      break;
    case kPropertyFrame:
      if (parent.empty || parent.hasNode) {
        throw ParseError("unexpected element <" + local + "> inside property element");
      }
      if (!isWhitespace(parent.text)) {
        throw ParseError("property element mixes text and a node element");
      }
      parent.hasNode = true;
      startNode(elementIRI, attributes, frame);
      break;
  }
}

void RdfXmlParser::startNode(const std::string& elementIRI, const AttributeVector& attributes, Frame frame)
{
  frame.type = kNodeFrame;
  const Attribute* about = find(attributes, kRDFNamespace, "about");
  const Attribute* id = find(attributes, kRDFNamespace, "ID");
  const Attribute* nodeID = find(attributes, kRDFNamespace, "nodeID");
  if ((about != nullptr) + (id != nullptr) + (nodeID != nullptr) > 1) {
    throw ParseError("node element with more than one of rdf:about, rdf:ID and rdf:nodeID");
  }

  if (about) {
    frame.subject = Term::iri(resolve(frame.base, about->value));
  } else if (id) {
    frame.subject = Term::iri(resolve(frame.base, "#" + id->value));
  } else if (nodeID) {
    frame.subject = blanks_.labelled(nodeID->value);
  } else {
    frame.subject = blanks_.fresh();
  }

  if (elementIRI != kRDFNamespace + "Description") {
    emit(frame.subject, Term::iri(kTypeURI), Term::iri(elementIRI));
  }

  // property attributes
  for (const Attribute& a : attributes) {
    if (isSyntaxAttribute(a)) {
      continue;
    }
    std::string predicate = a.ns + a.local;
    if (predicate == kTypeURI) {
      emit(frame.subject, Term::iri(kTypeURI), Term::iri(resolve(frame.base, a.value)));
    } else {
      emit(frame.subject, Term::iri(predicate), Term::langLiteral(a.value, frame.lang));
    }
  }

  if (!stack_.empty() && stack_.back().type == kPropertyFrame) {
    const Frame& property = stack_[stack_.size() - 1];
    const Frame& owner = stack_[stack_.size() - 2];
    emit(owner.subject, property.predicate, frame.subject);
  }
  stack_.push_back(frame);
}

void RdfXmlParser::startProperty(const std::string& elementIRI, const AttributeVector& attributes, Frame frame)
{
  Frame& owner = stack_.back();
  frame.type = kPropertyFrame;
  frame.subject = owner.subject;

  if (elementIRI == kRDFNamespace + "li") {
    std::ostringstream member;
    member << kRDFNamespace << "_" << ++owner.liCounter;
    frame.predicate = Term::iri(member.str());
  } else {
    frame.predicate = Term::iri(elementIRI);
  }

  if (find(attributes, kRDFNamespace, "ID")) {
    throw ParseError("rdf:ID on property elements (reification) is not supported");
  }
  if (const Attribute* datatype = find(attributes, kRDFNamespace, "datatype")) {
    frame.datatype = resolve(frame.base, datatype->value);
  }

  const Attribute* parseType = find(attributes, kRDFNamespace, "parseType");
  if (parseType) {
    if (parseType->value != "Resource") {
      throw ParseError("rdf:parseType=\"" + parseType->value + "\" is not supported");
    }
    // the element content is the property list of a new blank node
    Term object = blanks_.fresh();
    emit(frame.subject, frame.predicate, object);
    frame.type = kNodeFrame;
    frame.subject = object;
    stack_.push_back(frame);
    return;
  }

  const Attribute* resource = find(attributes, kRDFNamespace, "resource");
  const Attribute* nodeID = find(attributes, kRDFNamespace, "nodeID");
  if (resource && nodeID) {
    throw ParseError("property element with both rdf:resource and rdf:nodeID");
  }

  AttributeVector propertyAttributes;
  for (const Attribute& a : attributes) {
    if (!isSyntaxAttribute(a)) {
      propertyAttributes.push_back(a);
    }
  }

  if (resource || nodeID || !propertyAttributes.empty()) {
    Term object;
    if (resource) {
      object = Term::iri(resolve(frame.base, resource->value));
    } else if (nodeID) {
      object = blanks_.labelled(nodeID->value);
    } else {
      object = blanks_.fresh();
    }
    emit(frame.subject, frame.predicate, object);
    for (const Attribute& a : propertyAttributes) {
      std::string predicate = a.ns + a.local;
      if (predicate == kTypeURI) {
        emit(object, Term::iri(kTypeURI), Term::iri(resolve(frame.base, a.value)));
      } else {
        emit(object, Term::iri(predicate), Term::langLiteral(a.value, frame.lang));
      }
    }
    frame.empty = true;
  }
  stack_.push_back(frame);
}

void RdfXmlParser::characters(const char* ch, int len)
{
  if (stack_.empty()) {
    return;
  }
  stack_.back().text.append(ch, static_cast<std::size_t>(len));
}

void RdfXmlParser::endElement()
{
  if (stack_.empty()) {
    return;
  }
  Frame frame = stack_.back();
  stack_.pop_back();

  if (frame.type != kPropertyFrame) {
    if (!isWhitespace(frame.text)) {
      throw ParseError("unexpected text content in node element");
    }
    return;
  }
  if (frame.empty) {
    if (!isWhitespace(frame.text)) {
      throw ParseError("property element with rdf:resource or rdf:nodeID must be empty");
    }
    return;
  }
  if (frame.hasNode) {
    return;
  }

  Term object = frame.datatype.empty()
      ? Term::langLiteral(frame.text, frame.lang)
      : Term::typedLiteral(frame.text, frame.datatype);
  emit(frame.subject, frame.predicate, object);
}

////////////////////////////////////////////////////////////////////////////////

std::string escapeXML(const std::string& text)
{
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  result += "&amp;"; break;
      case '<':  result += "&lt;"; break;
      case '>':  result += "&gt;"; break;
      case '"':  result += "&quot;"; break;
      case '\r': result += "&#13;"; break;
      default:   result += c;
    }
  }
  return result;
}

bool isNCNameStart(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || (static_cast<unsigned char>(c) & 0x80);
}

bool isNCNameChar(char c)
{
  return isNCNameStart(c) || std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '.';
}

class RdfXmlWriter {
public:
  explicit RdfXmlWriter(const NamespaceTable& namespaces) : namespaces_(namespaces) {}
  std::string write(const TripleVector& triples);

private:
  NamespaceTable namespaces_;
  std::map<std::string, std::string> used_; // namespace -> prefix
  std::size_t generated_ = 0;

  std::string qname(const std::string& iri);
};

std::string RdfXmlWriter::qname(const std::string& iri)
{
  // split after the last character that cannot start a local name
  std::size_t split = iri.size();
  while (split > 0 && isNCNameChar(iri[split - 1])) {
    --split;
  }
  while (split < iri.size() && !isNCNameStart(iri[split])) {
    ++split;
  }
  if (split == 0 || split >= iri.size()) {
    throw EncodeError("predicate <" + iri + "> cannot be written as an XML element name");
  }
  std::string ns = iri.substr(0, split);
  std::string local = iri.substr(split);

  auto it(used_.find(ns));
  if (it != used_.end()) {
    return it->second + ":" + local;
  }

  std::string prefix;
  for (auto nit(namespaces_.begin()); nit != namespaces_.end(); ++nit) {
    if (nit->second == ns && !nit->first.empty()) {
      prefix = nit->first;
      break;
    }
  }
  if (prefix.empty()) {
    do {
      std::ostringstream generated;
      generated << "ns" << ++generated_;
      prefix = generated.str();
    } while (namespaces_.has(prefix));
    namespaces_.add(prefix, ns);
  }
  used_[ns] = prefix;
  return prefix + ":" + local;
}

std::string RdfXmlWriter::write(const TripleVector& triples)
{
  used_[kRDFNamespace] = "rdf";

  std::ostringstream body;
  for (std::size_t i(0); i != triples.size(); ++i) {
    const Triple& t = triples[i];
    if (!i || triples[i - 1].subject != t.subject) {
      if (i) {
        body << "  </rdf:Description>\n";
      }
      if (t.subject.isBlank()) {
        body << "  <rdf:Description rdf:nodeID=\"" << escapeXML(t.subject.value()) << "\">\n";
      } else {
        body << "  <rdf:Description rdf:about=\"" << escapeXML(t.subject.value()) << "\">\n";
      }
    }

    std::string element = qname(t.predicate.value());
    body << "    <" << element;
    switch (t.object.kind()) {
      case Term::kIRI:
        body << " rdf:resource=\"" << escapeXML(t.object.value()) << "\"/>\n";
        continue;
      case Term::kBlank:
        body << " rdf:nodeID=\"" << escapeXML(t.object.value()) << "\"/>\n";
        continue;
      case Term::kLiteral:
        break;
    }
    if (t.object.hasLanguage()) {
      body << " xml:lang=\"" << escapeXML(t.object.language()) << "\"";
    } else if (t.object.hasDatatype()) {
      body << " rdf:datatype=\"" << escapeXML(t.object.datatype()) << "\"";
    }
    body << ">" << escapeXML(t.object.value()) << "</" << element << ">\n";
  }
  if (!triples.empty()) {
    body << "  </rdf:Description>\n";
  }

  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out << "<rdf:RDF";
  for (auto it(used_.begin()); it != used_.end(); ++it) {
    out << "\n    xmlns:" << it->second << "=\"" << escapeXML(it->first) << "\"";
  }
  out << ">\n" << body.str() << "</rdf:RDF>\n";
  return out.str();
}

} // namespace

DecodeResult RdfXmlDecoder::decode(const std::string& text, const DecodeOptions& options)
{
  RdfXmlParser parser(options);
  return parser.parse(text);
}

std::string RdfXmlEncoder::encode(const TripleVector& triples, const EncodeOptions& options)
{
  RdfXmlWriter writer(options.namespaces);
  return writer.write(triples);
}
