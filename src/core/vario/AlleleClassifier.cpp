#include "AlleleClassifier.hpp"
#include <cctype>

using namespace std;

namespace vario {

ExtractedBases::ExtractedBases() : status(SPAN_OUT_OF_RANGE) {}
ExtractedBases::ExtractedBases(SpanStatus status) : status(status) {}
ExtractedBases::ExtractedBases(const string& bases) : status(SPAN_BASES), bases(bases) {}

PositionCall::PositionCall()
: position(nullptr), type(CALL_NOT_COVERED), idx_mutant(-1)
{}

PositionCall::PositionCall(const PositionOfInterest* position, CallType type, int idx_mutant)
: position(position), type(type), idx_mutant(type == CALL_MUTANT ? idx_mutant : -1)
{}

string PositionCall::tag() const {
  switch (type) {
    case CALL_WILDTYPE:
      return "WT";
    case CALL_MUTANT:
      return "M" + to_string(idx_mutant);
    case CALL_AMBIGUOUS:
      return "AMB";
    case CALL_NOT_COVERED:
    default:
      return "NC";
  }
}

bool PositionCall::operator== (const PositionCall& rhs) const {
  return position == rhs.position && type == rhs.type && idx_mutant == rhs.idx_mutant;
}

bool matchesAllele(const string& bases, const string& allele) {
  if (bases.size() != allele.size()) return false;
  for (size_t i=0; i<bases.size(); i++) {
    if (toupper(static_cast<unsigned char>(bases[i])) != toupper(static_cast<unsigned char>(allele[i]))) return false;
  }
  return true;
}

PositionCall classify(const ExtractedBases& extracted, const PositionOfInterest& position) {
  switch (extracted.status) {
    case SPAN_OUT_OF_RANGE:
    case SPAN_CLIPPED:
      return PositionCall(&position, CALL_NOT_COVERED);
    case SPAN_DELETED:
    case SPAN_INSERTION:
    case SPAN_LOW_QUALITY:
      return PositionCall(&position, CALL_AMBIGUOUS);
    case SPAN_BASES:
      break;
  }

  if (matchesAllele(extracted.bases, position.wildtype)) {
    return PositionCall(&position, CALL_WILDTYPE);
  }
  for (size_t i=0; i<position.mutants.size(); i++) {
    if (matchesAllele(extracted.bases, position.mutants[i])) {
      return PositionCall(&position, CALL_MUTANT, static_cast<int>(i));
    }
  }
  // sequenced, but not one of the configured alleles
  return PositionCall(&position, CALL_AMBIGUOUS);
}

} // namespace vario
