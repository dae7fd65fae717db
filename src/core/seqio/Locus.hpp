#ifndef LOCUS_H
#define LOCUS_H

#include "types.hpp"
#include <string>

namespace seqio {

/** Represents a genomic location */
struct Locus
{
  std::string id_ref;     // seq id in ref genome
  TCoord      start;      // start position in sequence (0-based, inclusive)
  TCoord      end;        // end position in sequence (0-based, exclusive)

  Locus();
  Locus(std::string id, TCoord start, TCoord end);
  ~Locus();

  /** Number of reference bases covered. */
  TCoord length() const;
  /** True if both loci are on the same sequence and share at least one base. */
  bool overlaps(const Locus& other) const;
  /** Returns region as tuple (seq id, start, end). */
  TRegion region() const;
};

} // namespace seqio

#endif // LOCUS_H
