#ifndef ALLELECLASSIFIER_H
#define ALLELECLASSIFIER_H

#include "PositionOfInterest.hpp"
#include <string>

namespace vario {

/** What a read showed at a position's reference span. */
enum SpanStatus {
  SPAN_BASES,         // contiguous read bases cover the whole span
  SPAN_OUT_OF_RANGE,  // some reference offset lies outside the aligned part of the read
  SPAN_CLIPPED,       // some reference offset is only reachable through clipped bases
  SPAN_DELETED,       // some reference offset falls in a deletion or reference skip
  SPAN_INSERTION,     // an insertion lies between two bases of the span
  SPAN_LOW_QUALITY    // bases present, but at least one is below the quality cutoff
};

/** Bases extracted from a read for one position. */
struct ExtractedBases
{
  SpanStatus status;
  std::string bases; // only meaningful if status is SPAN_BASES

  ExtractedBases();
  ExtractedBases(SpanStatus status);
  ExtractedBases(const std::string& bases);
};

/** Allele supported by a read at a position. */
enum CallType {
  CALL_WILDTYPE,
  CALL_MUTANT,
  CALL_AMBIGUOUS,
  CALL_NOT_COVERED
};

/** Call for one (read, position) pair. */
struct PositionCall
{
  const PositionOfInterest* position;
  CallType type;
  int idx_mutant; /** index into position->mutants (CALL_MUTANT only, -1 otherwise) */

  PositionCall();
  PositionCall(const PositionOfInterest* position, CallType type, int idx_mutant=-1);

  /** Short outcome tag: "WT", "M<i>", "AMB" or "NC". */
  std::string tag() const;
  bool operator== (const PositionCall&) const;
};

/**
 * Decide which allele the extracted bases support.
 *
 * Rules, in order:
 *   - out of range / clipped          -> CALL_NOT_COVERED
 *   - deleted / insertion / low qual  -> CALL_AMBIGUOUS
 *   - equals wildtype (any case)      -> CALL_WILDTYPE
 *   - equals mutant i (first match)   -> CALL_MUTANT, idx_mutant = i
 *   - otherwise                       -> CALL_AMBIGUOUS
 */
PositionCall classify(const ExtractedBases& extracted, const PositionOfInterest& position);

/** Case-insensitive comparison of a read's bases against an allele. */
bool matchesAllele(const std::string& bases, const std::string& allele);

} // namespace vario

#endif // ALLELECLASSIFIER_H
