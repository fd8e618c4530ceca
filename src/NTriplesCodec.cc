#include "NTriplesCodec.h"
#include "TurtleLexer.h"

namespace {

Term readIRI(const TurtleLexer& lexer)
{
  if (!NamespaceTable::isAbsolute(lexer.value())) {
    throw ResolutionError("relative IRI <" + lexer.value() + "> in N-Triples", lexer.line(), lexer.column());
  }
  return Term::iri(lexer.value());
}

void fail(const TurtleLexer& lexer, const std::string& what, TurtleLexer::Token found)
{
  throw ParseError(std::string("expected ") + what + ", found " + TurtleLexer::tokenName(found),
      lexer.line(), lexer.column());
}

// parses the single statement on a line, returns false for blank or comment lines
bool parseLine(TurtleLexer& lexer, BlankNodeLabeler& blanks, Triple& t)
{
  TurtleLexer::Token token = lexer.getNext();
  if (token == TurtleLexer::Eof) {
    return false;
  }

  if (token == TurtleLexer::IRI) {
    t.subject = readIRI(lexer);
  } else if (token == TurtleLexer::BlankNode) {
    t.subject = blanks.labelled(lexer.value());
  } else {
    fail(lexer, "subject IRI or blank node", token);
  }

  token = lexer.getNext();
  if (token != TurtleLexer::IRI) {
    fail(lexer, "predicate IRI", token);
  }
  t.predicate = readIRI(lexer);

  token = lexer.getNext();
  if (token == TurtleLexer::IRI) {
    t.object = readIRI(lexer);
  } else if (token == TurtleLexer::BlankNode) {
    t.object = blanks.labelled(lexer.value());
  } else if (token == TurtleLexer::String) {
    std::string lexical = lexer.value();
    token = lexer.getNext();
    if (token == TurtleLexer::LangTag) {
      t.object = Term::langLiteral(lexical, lexer.value());
    } else if (token == TurtleLexer::DoubleCaret) {
      token = lexer.getNext();
      if (token != TurtleLexer::IRI) {
        fail(lexer, "datatype IRI", token);
      }
      t.object = Term::typedLiteral(lexical, readIRI(lexer).value());
    } else {
      lexer.unget(token);
      t.object = Term::literal(lexical);
    }
  } else {
    fail(lexer, "object", token);
  }

  token = lexer.getNext();
  if (token != TurtleLexer::Dot) {
    fail(lexer, "'.'", token);
  }
  token = lexer.getNext();
  if (token != TurtleLexer::Eof) {
    fail(lexer, "end of line", token);
  }
  return true;
}

} // namespace

DecodeResult NTriplesDecoder::decode(const std::string& text, const DecodeOptions& options)
{
  DecodeResult result;
  BlankNodeLabeler blanks(options.blankPrefix);
  std::size_t lineNumber = 1;
  std::size_t start = 0;

  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);

    TurtleLexer lexer(line, lineNumber);
    Triple t;
    if (parseLine(lexer, blanks, t)) {
      result.triples.push_back(t);
    }

    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
    ++lineNumber;
  }

  return result;
}

std::string NTriplesEncoder::encode(const TripleVector& triples, const EncodeOptions&)
{
  std::string out;
  for (const Triple& t : triples) {
    out += t.toString();
    out += '\n';
  }
  return out;
}
