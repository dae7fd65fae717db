#ifndef POSITIONOFINTEREST_H
#define POSITIONOFINTEREST_H

#include "../seqio/types.hpp"
#include "../seqio/Locus.hpp"
#include <string>
#include <vector>

namespace vario {

/** A reference range annotated with a wildtype and one or more mutant alleles. */
struct PositionOfInterest
{
  unsigned idx;                       /** index in table order */
  unsigned long line;                 /** line in positions file (0: not from file) */
  std::string chr;                    /** reference sequence name */
  seqio::TCoord start;                /** 0-based, inclusive */
  seqio::TCoord end;                  /** 0-based, exclusive */
  std::string label;                  /** user-defined name */
  std::string wildtype;               /** wildtype allele (upper case) */
  std::vector<std::string> mutants;   /** mutant alleles in declared order (upper case) */

  PositionOfInterest();
  PositionOfInterest(
    std::string chr,
    seqio::TCoord start,
    seqio::TCoord end,
    std::string label,
    std::string wildtype,
    std::vector<std::string> mutants
  );

  /** Number of reference bases spanned. */
  seqio::TCoord length() const;
  /** Genomic location of this position. */
  seqio::Locus locus() const;

  /** Order by (chr, start, end, line). */
  bool operator< (const PositionOfInterest&) const;
};

} // namespace vario

#endif // POSITIONOFINTEREST_H
