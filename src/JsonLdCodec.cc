#include "JsonLdCodec.h"
#include "types.h"

#include <cstdio>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <json/json.h>

namespace {

// A term definition from @context: "name": "iri" or "name": {"@id": ..., "@type": ...}
struct TermDefinition {
  std::string iri;
  // "@id" to read string values as IRIs, otherwise a datatype IRI
  std::string type;
  std::string language;
};

struct Context {
  std::map<std::string, TermDefinition> terms;
  std::string vocab;
  std::string base;
  std::string language;
};

std::string stringValue(const Json::Value& value, const std::string& what)
{
  if (!value.isString()) {
    throw ParseError(what + " must be a string");
  }
  return value.asString();
}

// canonical xsd:double form: 1.5E0, 4.2E-3
std::string canonicalDouble(double number)
{
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%1.15E", number);
  std::string text(buffer);
  std::size_t e = text.find('E');
  std::string mantissa = text.substr(0, e);
  std::size_t last = mantissa.find_last_not_of('0');
  if (mantissa[last] == '.') {
    ++last;
  }
  mantissa.erase(last + 1);
  std::ostringstream out;
  out << mantissa << 'E' << std::stoi(text.substr(e + 1));
  return out.str();
}

// true if value is or uses a term of pending other than key
bool dependsOn(const std::string& value, const std::string& key, const std::map<std::string, Json::Value>& pending)
{
  std::string name = value.substr(0, value.find(':'));
  return name != key && pending.count(name) && value.compare(name.size(), 3, "://") != 0;
}

// namespaces that shorten IRIs, a term like "name" for a full property IRI is not one
bool isNamespaceIRI(const std::string& iri)
{
  return !iri.empty() && (iri.back() == '/' || iri.back() == '#');
}

class JsonLdReader {
public:
  explicit JsonLdReader(const DecodeOptions& options) : blanks_(options.blankPrefix)
  {
    for (auto it(options.namespaces.begin()); it != options.namespaces.end(); ++it) {
      TermDefinition definition;
      definition.iri = it->second;
      initial_.terms[it->first] = definition;
    }
    initial_.base = options.baseIRI;
  }

  DecodeResult read(const Json::Value& root);

private:
  Context initial_;
  BlankNodeLabeler blanks_;
  DecodeResult result_;

  void processContext(const Json::Value& node, Context& ctx);
  Term processNode(const Json::Value& node, const Context& parent);
  void processValue(const Term& subject, const Term& predicate, const std::string& key,
                    const Json::Value& value, const Context& ctx);
  Term processList(const Json::Value& items, const std::string& key, const Context& ctx);
  // returns false for null values, which produce no triple
  bool valueTerm(const std::string& key, const Json::Value& value, const Context& ctx, Term& term);
  Term nativeLiteral(const Json::Value& value, const std::string& datatype);
  Term expand(const std::string& value, const Context& ctx, bool vocab);
  void emit(const Term& s, const Term& p, const Term& o) { result_.triples.push_back(Triple(s, p, o)); }
};

DecodeResult JsonLdReader::read(const Json::Value& root)
{
  if (root.isArray()) {
    for (auto it(root.begin()); it != root.end(); ++it) {
      processNode(*it, initial_);
    }
  } else if (root.isObject()) {
    // a top level object with only @context and @graph does not describe a node
    if (root.isMember("@graph") && root.size() == (root.isMember("@context") ? 2u : 1u)) {
      const Json::Value& graph = root["@graph"];
      Context ctx(initial_);
      if (root.isMember("@context")) {
        processContext(root["@context"], ctx);
      }
      if (graph.isArray()) {
        for (auto it(graph.begin()); it != graph.end(); ++it) {
          processNode(*it, ctx);
        }
      } else {
        processNode(graph, ctx);
      }
      return result_;
    }
    processNode(root, initial_);
  } else {
    throw ParseError("a JSON-LD document is an object or an array");
  }
  return result_;
}

void JsonLdReader::processContext(const Json::Value& node, Context& ctx)
{
  if (node.isNull()) {
    ctx = initial_;
    return;
  }
  if (node.isArray()) {
    for (auto it(node.begin()); it != node.end(); ++it) {
      processContext(*it, ctx);
    }
    return;
  }
  if (node.isString()) {
    throw ParseError("remote contexts are not supported: " + node.asString());
  }
  if (!node.isObject()) {
    throw ParseError("invalid @context");
  }

  // members come in key order, a term may use a prefix defined after it
  std::map<std::string, Json::Value> pending;
  for (auto it(node.begin()); it != node.end(); ++it) {
    const std::string key = it.name();
    const Json::Value& value = *it;
    if (key == "@vocab") {
      ctx.vocab = value.isNull() ? std::string() : stringValue(value, "@vocab");
    } else if (key == "@base") {
      ctx.base = value.isNull() ? std::string() : NamespaceTable::resolveRelative(ctx.base, stringValue(value, "@base"));
    } else if (key == "@language") {
      ctx.language = value.isNull() ? std::string() : stringValue(value, "@language");
    } else if (key == "@version") {
      continue;
    } else if (value.isNull()) {
      ctx.terms.erase(key);
    } else {
      pending[key] = value;
    }
  }

  while (!pending.empty()) {
    bool progress = false;
    for (auto it(pending.begin()); it != pending.end();) {
      const std::string& key = it->first;
      const Json::Value& value = it->second;
      std::string id, type;
      if (value.isObject()) {
        id = value.isMember("@id") ? stringValue(value["@id"], "@id of '" + key + "'") : key;
        type = value.isMember("@type") ? stringValue(value["@type"], "@type of '" + key + "'") : "";
      } else {
        id = stringValue(value, "term definition '" + key + "'");
      }
      if (dependsOn(id, key, pending) || dependsOn(type, key, pending)) {
        ++it;
        continue;
      }

      TermDefinition definition;
      definition.iri = expand(id, ctx, true).value();
      if (type == "@id" || type == "@vocab") {
        definition.type = "@id";
      } else if (!type.empty()) {
        definition.type = expand(type, ctx, true).value();
      }
      if (value.isObject() && value.isMember("@language") && !value["@language"].isNull()) {
        definition.language = stringValue(value["@language"], "@language of '" + key + "'");
      }
      ctx.terms[key] = definition;
      if (isNamespaceIRI(definition.iri)) {
        result_.namespaces.add(key, definition.iri);
      }
      it = pending.erase(it);
      progress = true;
    }
    if (!progress) {
      throw ParseError("cyclic term definitions in @context");
    }
  }
}

Term JsonLdReader::processNode(const Json::Value& node, const Context& parent)
{
  if (!node.isObject()) {
    throw ParseError("expected a node object, found '" + node.toStyledString() + "'");
  }

  Context ctx(parent);
  if (node.isMember("@context")) {
    processContext(node["@context"], ctx);
  }

  Term subject;
  if (node.isMember("@id")) {
    const std::string& id = stringValue(node["@id"], "@id");
    subject = expand(id, ctx, false);
    if (subject.isLiteral()) {
      throw ParseError("invalid @id '" + id + "'");
    }
  } else {
    subject = blanks_.fresh();
  }

  for (auto it(node.begin()); it != node.end(); ++it) {
    const std::string key = it.name();
    const Json::Value& value = *it;

    if (key == "@context" || key == "@id" || key == "@index") {
      continue;
    }
    if (key == "@type") {
      const Term type = Term::iri(kTypeURI);
      if (value.isArray()) {
        for (auto vit(value.begin()); vit != value.end(); ++vit) {
          emit(subject, type, expand(stringValue(*vit, "@type"), ctx, true));
        }
      } else {
        emit(subject, type, expand(stringValue(value, "@type"), ctx, true));
      }
      continue;
    }
    if (key == "@graph") {
      if (value.isArray()) {
        for (auto git(value.begin()); git != value.end(); ++git) {
          processNode(*git, ctx);
        }
      } else {
        processNode(value, ctx);
      }
      continue;
    }
    if (key[0] == '@') {
      throw ParseError("unsupported JSON-LD keyword '" + key + "'");
    }

    Term predicate = expand(key, ctx, true);
    if (!predicate.isIRI()) {
      throw ParseError("property '" + key + "' does not expand to an IRI");
    }
    processValue(subject, predicate, key, value, ctx);
  }

  return subject;
}

void JsonLdReader::processValue(const Term& subject, const Term& predicate, const std::string& key,
                                const Json::Value& value, const Context& ctx)
{
  if (value.isArray()) {
    for (auto it(value.begin()); it != value.end(); ++it) {
      processValue(subject, predicate, key, *it, ctx);
    }
    return;
  }
  Term object;
  if (valueTerm(key, value, ctx, object)) {
    emit(subject, predicate, object);
  }
}

Term JsonLdReader::nativeLiteral(const Json::Value& value, const std::string& datatype)
{
  if (value.isBool()) {
    return Term::typedLiteral(value.asBool() ? "true" : "false", datatype.empty() ? kXSDBooleanURI : datatype);
  }
  // integral numbers below 10^21 are integers, 1.0 included
  if (value.isIntegral() && datatype != kXSDDoubleURI) {
    std::ostringstream lexical;
    if (value.isUInt64() && !value.isInt64()) {
      lexical << value.asLargestUInt();
    } else {
      lexical << value.asLargestInt();
    }
    return Term::typedLiteral(lexical.str(), datatype.empty() ? kXSDIntegerURI : datatype);
  }
  return Term::typedLiteral(canonicalDouble(value.asDouble()), datatype.empty() ? kXSDDoubleURI : datatype);
}

bool JsonLdReader::valueTerm(const std::string& key, const Json::Value& value, const Context& ctx, Term& term)
{
  auto definition(ctx.terms.find(key));
  bool hasDefinition = definition != ctx.terms.end();
  std::string coercion = hasDefinition ? definition->second.type : std::string();

  if (value.isNull()) {
    return false;
  }
  if (value.isBool() || value.isNumeric()) {
    term = nativeLiteral(value, coercion == "@id" ? std::string() : coercion);
    return true;
  }
  if (value.isString()) {
    if (coercion == "@id") {
      term = expand(value.asString(), ctx, false);
    } else if (!coercion.empty()) {
      term = Term::typedLiteral(value.asString(), coercion);
    } else {
      std::string language = hasDefinition && !definition->second.language.empty()
          ? definition->second.language : ctx.language;
      term = Term::langLiteral(value.asString(), language);
    }
    return true;
  }
  if (!value.isObject()) {
    throw ParseError("nested arrays are not supported");
  }

  if (value.isMember("@value")) {
    const Json::Value& literal = value["@value"];
    std::string type = value.isMember("@type") ? stringValue(value["@type"], "@type") : "";
    std::string language = value.isMember("@language") ? stringValue(value["@language"], "@language") : "";
    if (!type.empty() && !language.empty()) {
      throw ParseError("value object has both @type and @language");
    }
    if (literal.isNull()) {
      return false;
    }
    std::string datatype = type.empty() ? std::string() : expand(type, ctx, true).value();
    if (literal.isBool() || literal.isNumeric()) {
      term = nativeLiteral(literal, datatype);
    } else if (!literal.isString()) {
      throw ParseError("@value must be a scalar");
    } else if (!datatype.empty()) {
      term = Term::typedLiteral(literal.asString(), datatype);
    } else {
      term = Term::langLiteral(literal.asString(), language);
    }
    return true;
  }

  if (value.isMember("@list")) {
    term = processList(value["@list"], key, ctx);
    return true;
  }

  // node reference or embedded node object
  term = processNode(value, ctx);
  return true;
}

Term JsonLdReader::processList(const Json::Value& items, const std::string& key, const Context& ctx)
{
  const Term first = Term::iri(kFirstURI);
  const Term rest = Term::iri(kRestURI);
  Term head = Term::iri(kNilURI);
  Term current;

  std::vector<Term> elements;
  if (items.isArray()) {
    for (auto it(items.begin()); it != items.end(); ++it) {
      Term element;
      if (valueTerm(key, *it, ctx, element)) {
        elements.push_back(element);
      }
    }
  } else {
    Term element;
    if (valueTerm(key, items, ctx, element)) {
      elements.push_back(element);
    }
  }

  for (const Term& element : elements) {
    Term cell = blanks_.fresh();
    if (head.isIRI()) {
      head = cell;
    } else {
      emit(current, rest, cell);
    }
    current = cell;
    emit(cell, first, element);
  }
  if (!head.isIRI()) {
    emit(current, rest, Term::iri(kNilURI));
  }
  return head;
}

Term JsonLdReader::expand(const std::string& value, const Context& ctx, bool vocab)
{
  if (value.compare(0, 2, "_:") == 0) {
    return blanks_.labelled(value.substr(2));
  }
  if (vocab) {
    auto term(ctx.terms.find(value));
    if (term != ctx.terms.end()) {
      return Term::iri(term->second.iri);
    }
  }

  std::size_t colon = value.find(':');
  if (colon != std::string::npos) {
    std::string prefix = value.substr(0, colon);
    std::string suffix = value.substr(colon + 1);
    auto term(ctx.terms.find(prefix));
    if (term != ctx.terms.end() && suffix.compare(0, 2, "//") != 0) {
      return Term::iri(term->second.iri + suffix);
    }
    if (NamespaceTable::isAbsolute(value)) {
      return Term::iri(value);
    }
  }

  if (vocab && !ctx.vocab.empty()) {
    return Term::iri(ctx.vocab + value);
  }
  if (vocab) {
    throw ResolutionError("cannot expand '" + value + "' to an IRI");
  }
  return Term::iri(NamespaceTable::resolveRelative(ctx.base, value));
}

////////////////////////////////////////////////////////////////////////////////

class JsonLdWriter {
public:
  explicit JsonLdWriter(const NamespaceTable& namespaces) : namespaces_(namespaces) {}
  std::string write(const TripleVector& triples);

private:
  const NamespaceTable& namespaces_;
  std::set<std::string> used_;

  std::string compact(const std::string& iri);
  std::string nodeId(const Term& term);
  Json::Value valueObject(const Term& term);
};

std::string JsonLdWriter::compact(const std::string& iri)
{
  std::string prefix, local;
  // a compact IRI whose local part starts with // would read back as an absolute IRI
  if (namespaces_.shorten(iri, prefix, local) && local.compare(0, 2, "//") != 0) {
    used_.insert(prefix);
    return prefix + ":" + local;
  }
  return iri;
}

std::string JsonLdWriter::nodeId(const Term& term)
{
  return term.isBlank() ? "_:" + term.value() : compact(term.value());
}

Json::Value JsonLdWriter::valueObject(const Term& term)
{
  Json::Value value(Json::objectValue);
  if (!term.isLiteral()) {
    value["@id"] = nodeId(term);
  } else {
    // lexical forms stay strings, a native number could change them
    value["@value"] = term.value();
    if (term.hasLanguage()) {
      value["@language"] = term.language();
    } else if (term.hasDatatype()) {
      value["@type"] = compact(term.datatype());
    }
  }
  return value;
}

std::string JsonLdWriter::write(const TripleVector& triples)
{
  // keep subjects in input order, jsoncpp orders the members of each node
  std::vector<Term> subjects;
  std::map<Term, std::vector<std::pair<Term, std::vector<Term>>>> properties;
  for (const Triple& t : triples) {
    auto& list = properties[t.subject];
    if (list.empty()) {
      subjects.push_back(t.subject);
    }
    if (list.empty() || list.back().first != t.predicate) {
      list.push_back(std::make_pair(t.predicate, std::vector<Term>()));
    }
    list.back().second.push_back(t.object);
  }

  Json::Value graph(Json::arrayValue);
  for (const Term& subject : subjects) {
    Json::Value node(Json::objectValue);
    node["@id"] = nodeId(subject);

    for (auto& property : properties[subject]) {
      for (const Term& object : property.second) {
        if (property.first.value() == kTypeURI && object.isIRI()) {
          node["@type"].append(compact(object.value()));
        } else {
          node[compact(property.first.value())].append(valueObject(object));
        }
      }
    }
    graph.append(node);
  }

  Json::Value root(Json::objectValue);
  for (auto it(namespaces_.begin()); it != namespaces_.end(); ++it) {
    if (used_.count(it->first)) {
      root["@context"][it->first] = it->second;
    }
  }
  root["@graph"] = graph;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["enableYAMLCompatibility"] = true;
  builder["emitUTF8"] = true;
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  std::ostringstream out;
  writer->write(root, &out);
  out << '\n';
  return out.str();
}

} // namespace

DecodeResult JsonLdDecoder::decode(const std::string& text, const DecodeOptions& options)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    // "* Line 1, Column 9\n  Syntax error: value, object or array expected.\n"
    unsigned long line = 0, column = 0;
    std::size_t newline = errors.find('\n');
    std::string reason = newline == std::string::npos ? errors : errors.substr(newline + 1);
    reason.erase(0, reason.find_first_not_of(' '));
    reason.erase(reason.find_last_not_of("\n ") + 1);
    if (std::sscanf(errors.c_str(), "* Line %lu, Column %lu", &line, &column) == 2) {
      throw ParseError(reason, line, column);
    }
    throw ParseError(reason);
  }

  JsonLdReader jsonLd(options);
  return jsonLd.read(root);
}

std::string JsonLdEncoder::encode(const TripleVector& triples, const EncodeOptions& options)
{
  JsonLdWriter writer(options.namespaces);
  return writer.write(triples);
}
