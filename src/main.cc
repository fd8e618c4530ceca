#include <iostream>
#include <cstdlib>
#include <climits>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "types.h"
#include "Codec.h"
#include "Engine.h"
#include "Timer.h"

void PrintUsage();
void PrintError(const std::string& source, const Error& error);
bool ReadFile(const std::string& fileName, std::string& contents);
std::string BaseIRI(const std::string& fileName);
bool WriteOutput(const std::string& fileName, const std::string& contents);

int main(int argc, const char* argv[])
{
  std::string command, format, outputFile, outputFormat, queryText, queryFile, ruleSet, shapesFile, configFile;
  std::vector<std::string> inputFiles;
  std::size_t maxIterations;
  bool useInference, useAxioms, timeExecution;

  namespace po = boost::program_options;
  po::options_description desc("options");
  desc.add_options()
    ("help,h", "produce this help message")
    ("input,i", po::value<std::vector<std::string>>(&inputFiles), "RDF file to load (repeatable)")
    ("format", po::value<std::string>(&format), "input syntax (turtle, ntriples, jsonld, rdfxml), guessed from the extension by default")
    ("output,o", po::value<std::string>(&outputFile), "write results to this file instead of stdout")
    ("output-format", po::value<std::string>(&outputFormat), "output syntax for graphs (default turtle)")
    ("query,q", po::value<std::string>(&queryText), "query text")
    ("query-file", po::value<std::string>(&queryFile), "file containing the query")
    ("infer", po::bool_switch(&useInference), "compute the RDFS closure after loading")
    ("max-iterations", po::value<std::size_t>(&maxIterations)->default_value(Reasoner::kDefaultMaxIterations), "inference round cap")
    ("rules", po::value<std::string>(&ruleSet)->default_value("core"), "rule set to use (core, rhodf)")
    ("axioms,a", po::bool_switch(&useAxioms), "include finite RDFS axiomatic triples")
    ("shapes", po::value<std::string>(&shapesFile), "SHACL shapes file for validate")
    ("time,t", po::bool_switch(&timeExecution), "print timings")
    ("config", po::value<std::string>(&configFile), "read options from an INI style file")
  ;

  po::options_description hidden;
  hidden.add_options()
    ("command", po::value<std::string>(&command), "query, infer, validate, convert, export or stats")
  ;
  po::options_description all;
  all.add(desc).add(hidden);
  po::positional_options_description positional;
  positional.add("command", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    if (vm.count("config")) {
      std::ifstream config(vm["config"].as<std::string>());
      if (config.fail()) {
        std::clog << "could not read config file '" << vm["config"].as<std::string>() << "'.\n";
        return EXIT_FAILURE;
      }
      // command line values win, they were stored first
      po::store(po::parse_config_file(config, desc), vm);
    }
    po::notify(vm);
  } catch (po::error& e) {
    std::clog << e.what() << std::endl;
    PrintUsage();
    std::clog << desc << std::endl;
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    PrintUsage();
    std::clog << desc << std::endl;
    return EXIT_SUCCESS;
  }

  if (command.empty()) {
    command = (queryText.size() || queryFile.size()) ? "query" : "";
  }
  if (command != "query" && command != "infer" && command != "validate" && command != "convert"
      && command != "export" && command != "stats") {
    if (command.size()) {
      std::clog << "Unknown command: " << command << std::endl;
    }
    PrintUsage();
    return EXIT_FAILURE;
  }

  EngineOptions options;
  if (ruleSet == "core") {
    options.ruleSet = Reasoner::kCoreRuleSet;
  } else if (ruleSet == "rhodf") {
    options.ruleSet = Reasoner::kRhoDFRuleSet;
  } else {
    std::clog << "Unknown rule set: " << ruleSet << std::endl;
    return EXIT_FAILURE;
  }
  options.axioms = useAxioms;

  Format graphFormat(kTurtle);
  if (outputFormat.size() && !formatFromName(outputFormat, graphFormat)) {
    std::clog << "Unknown output format: " << outputFormat << std::endl;
    return EXIT_FAILURE;
  }
  if (command == "convert" && outputFormat.empty()) {
    std::clog << "convert needs --output-format" << std::endl;
    return EXIT_FAILURE;
  }

  Engine engine(options);
  Timer loading, inference, evaluation;

  for (const std::string& fileName : inputFiles) {
    Format inputFormat;
    if (format.size() ? !formatFromName(format, inputFormat) : !formatFromExtension(fileName, inputFormat)) {
      std::clog << "could not determine the syntax of '" << fileName << "', use --format.\n";
      return EXIT_FAILURE;
    }

    std::string contents;
    if (!ReadFile(fileName, contents)) {
      std::clog << "could not read file '" << fileName << "'.\n";
      return EXIT_FAILURE;
    }

    Result<LoadStats> stats = LoadStats();
    {
      Timer::Scope scope(loading);
      stats = engine.load(contents, inputFormat, BaseIRI(fileName));
    }
    if (!stats) {
      PrintError(fileName, stats.error());
      return EXIT_FAILURE;
    }
    std::clog << "loaded " << fileName << " (" << formatName(inputFormat) << "): "
              << stats.value().triplesAdded << " new of " << stats.value().triplesParsed << " triples" << std::endl;
  }

  if (useInference || command == "infer") {
    Result<InferenceReport> report = InferenceReport();
    {
      Timer::Scope scope(inference);
      report = engine.infer(maxIterations);
    }
    if (!report) {
      PrintError("infer", report.error());
      return EXIT_FAILURE;
    }

    const InferenceReport& r = report.value();
    std::clog << "Inference statistics" << std::endl;
    std::clog << "    rounds: " << r.roundsRun << std::endl;
    std::clog << "    inferred unique triples: " << r.triplesAdded << std::endl;
    if (useAxioms) {
      std::clog << "    axiomatic triples: " << r.axiomaticTriples << std::endl;
    }
    for (std::size_t i(0); i != r.perRound.size(); ++i) {
      std::clog << "        round " << i + 1 << ": " << r.perRound[i] << std::endl;
    }
    std::clog << "    fixpoint reached: " << (r.fixpointReached ? "yes" : "no") << std::endl;
    if (!r.fixpointReached) {
      std::clog << "warning: stopped after " << maxIterations << " rounds, the closure is incomplete" << std::endl;
    }
  }

  int status(EXIT_SUCCESS);
  std::string output;

  if (command == "query") {
    if (queryText.empty() && queryFile.size() && !ReadFile(queryFile, queryText)) {
      std::clog << "could not read file '" << queryFile << "'.\n";
      return EXIT_FAILURE;
    }
    if (queryText.empty()) {
      std::clog << "query needs --query or --query-file" << std::endl;
      return EXIT_FAILURE;
    }

    Result<QueryResult> result = QueryResult();
    {
      Timer::Scope scope(evaluation);
      result = engine.query(queryText);
    }
    if (!result) {
      PrintError("query", result.error());
      return EXIT_FAILURE;
    }

    const QueryResult& r = result.value();
    std::clog << Query::formName(r.form) << ": " << r.size() << " result(s)" << std::endl;
    if (r.form == Query::kConstruct || r.form == Query::kDescribe) {
      EncodeOptions encodeOptions;
      encodeOptions.namespaces = engine.namespaces();
      Result<std::string> text = encode(graphFormat, r.triples, encodeOptions);
      if (!text) {
        PrintError("query", text.error());
        return EXIT_FAILURE;
      }
      output = text.value();
    } else {
      output = r.toJson();
    }
  } else if (command == "validate") {
    if (shapesFile.empty()) {
      std::clog << "validate needs --shapes" << std::endl;
      return EXIT_FAILURE;
    }
    Format shapesFormat;
    std::string shapes;
    if (!formatFromExtension(shapesFile, shapesFormat)) {
      shapesFormat = kTurtle;
    }
    if (!ReadFile(shapesFile, shapes)) {
      std::clog << "could not read file '" << shapesFile << "'.\n";
      return EXIT_FAILURE;
    }

    Result<ValidationReport> report = ValidationReport();
    {
      Timer::Scope scope(evaluation);
      report = engine.validate(shapes, shapesFormat);
    }
    if (!report) {
      PrintError(shapesFile, report.error());
      return EXIT_FAILURE;
    }
    output = report.value().toString();
    std::clog << (report.value().conforms ? "conforms" : "does not conform") << ": "
              << report.value().violations.size() << " violation(s)" << std::endl;
    if (!report.value().conforms) {
      status = EXIT_FAILURE;
    }
  } else if (command == "stats") {
    Graph::Statistics stats = engine.statistics();
    std::ostringstream out;
    out << "triples: " << stats.triples << "\n";
    out << "subjects: " << stats.subjects << "\n";
    out << "predicates: " << stats.predicates << "\n";
    out << "objects: " << stats.objects << "\n";
    out << "classes: " << stats.classes << "\n";
    out << "properties: " << stats.properties << "\n";
    for (const Term& ontology : stats.ontologies) {
      out << "ontology: " << ontology << "\n";
    }
    output = out.str();
  } else {
    // convert, export and infer write the graph
    Result<std::string> text = engine.exportGraph(graphFormat);
    if (!text) {
      PrintError("export", text.error());
      return EXIT_FAILURE;
    }
    output = text.value();
  }

  if (!WriteOutput(outputFile, output)) {
    std::clog << "could not write file '" << outputFile << "'.\n";
    return EXIT_FAILURE;
  }

  if (timeExecution) {
    std::clog.setf(std::ios::fixed, std::ios::floatfield);
    std::clog.precision(2);
    std::clog << "Timings" << std::endl;
    std::clog << "    loading: " << loading.elapsed() << " ms" << std::endl;
    std::clog << "    inference: " << inference.elapsed() << " ms" << std::endl;
    std::clog << "    evaluation: " << evaluation.elapsed() << " ms" << std::endl;
  }

  return status;
}

void PrintUsage() {
  std::clog << "usage: kgraph <query|infer|validate|convert|export|stats> --input <file> [options]" << std::endl;
}

void PrintError(const std::string& source, const Error& error)
{
  std::clog << source << ": " << error.what() << std::endl;
  if (error.fragment().size()) {
    std::clog << "    near: " << error.fragment() << std::endl;
  }
}

bool ReadFile(const std::string& fileName, std::string& contents)
{
  std::ifstream file(fileName, std::ifstream::in | std::ifstream::binary);
  if (file.fail()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  contents = buffer.str();
  return true;
}

// file:// IRI of the document, relative IRIs resolve against it
std::string BaseIRI(const std::string& fileName)
{
  char resolved[PATH_MAX];
  if (!realpath(fileName.c_str(), resolved)) {
    return "";
  }
  return std::string("file://") + resolved;
}

bool WriteOutput(const std::string& fileName, const std::string& contents)
{
  if (fileName.empty()) {
    std::cout << contents;
    return true;
  }
  std::ofstream file(fileName, std::ofstream::out | std::ofstream::binary);
  if (file.fail()) {
    return false;
  }
  file << contents;
  return file.good();
}
