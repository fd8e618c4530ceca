#include "Query.h"

#include <memory>
#include <sstream>
#include <json/json.h>

PatternTerm PatternTerm::variable(const std::string& name)
{
  PatternTerm result;
  result.variable_ = name;
  return result;
}

std::string PatternTerm::toString() const
{
  if (isVariable()) {
    return "?" + variable_;
  }
  return term_.toString();
}

std::string TriplePattern::toString() const
{
  return subject.toString() + " " + predicate.toString() + " " + object.toString() + " .";
}

////////////////////////////////////////////////////////////////////////////////

Query Query::select(const std::vector<std::string>& variables, const PatternVector& where)
{
  Query q;
  q.form = kSelect;
  q.variables = variables;
  q.selectAll = variables.empty();
  q.where = where;
  return q;
}

Query Query::ask(const PatternVector& where)
{
  Query q;
  q.form = kAsk;
  q.where = where;
  return q;
}

Query Query::constructQuery(const PatternVector& templatePatterns, const PatternVector& where)
{
  Query q;
  q.form = kConstruct;
  q.construct = templatePatterns;
  q.where = where;
  return q;
}

Query Query::describeQuery(const PatternTerm& resource, const PatternVector& where)
{
  Query q;
  q.form = kDescribe;
  q.describe = resource;
  q.where = where;
  return q;
}

const char* Query::formName(Form form)
{
  switch (form) {
    case kSelect:    return "SELECT";
    case kAsk:       return "ASK";
    case kConstruct: return "CONSTRUCT";
    case kDescribe:  return "DESCRIBE";
  }
  return "";
}

////////////////////////////////////////////////////////////////////////////////

namespace {

Json::Value termObject(const Term& term)
{
  Json::Value node(Json::objectValue);
  switch (term.kind()) {
    case Term::kIRI:
      node["type"] = "uri";
      break;
    case Term::kBlank:
      node["type"] = "bnode";
      break;
    case Term::kLiteral:
      node["type"] = "literal";
      break;
  }
  node["value"] = term.value();
  if (term.hasLanguage()) {
    node["xml:lang"] = term.language();
  } else if (term.hasDatatype()) {
    node["datatype"] = term.datatype();
  }
  return node;
}

}

std::size_t QueryResult::size() const
{
  switch (form) {
    case Query::kSelect:
      return rows.size();
    case Query::kAsk:
      return boolean ? 1 : 0;
    case Query::kConstruct:
    case Query::kDescribe:
      return triples.size();
  }
  return 0;
}

std::string QueryResult::toJson() const
{
  Json::Value root(Json::objectValue);

  if (form == Query::kSelect || form == Query::kAsk) {
    Json::Value head(Json::objectValue);
    if (form == Query::kSelect) {
      Json::Value vars(Json::arrayValue);
      for (const std::string& name : variables) {
        vars.append(name);
      }
      head["vars"] = vars;
    }
    root["head"] = head;

    if (form == Query::kAsk) {
      root["boolean"] = boolean;
    } else {
      Json::Value bindings(Json::arrayValue);
      for (const Binding& row : rows) {
        Json::Value solution(Json::objectValue);
        for (auto it(std::begin(row)); it != std::end(row); ++it) {
          solution[it->first] = termObject(it->second);
        }
        bindings.append(solution);
      }
      root["results"]["bindings"] = bindings;
    }
  } else {
    Json::Value list(Json::arrayValue);
    for (const Triple& t : triples) {
      Json::Value triple(Json::objectValue);
      triple["subject"] = termObject(t.subject);
      triple["predicate"] = termObject(t.predicate);
      triple["object"] = termObject(t.object);
      list.append(triple);
    }
    root["triples"] = list;
  }

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
