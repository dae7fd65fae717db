#ifndef SEQIO_TYPES_H
#define SEQIO_TYPES_H

#include <string>
#include <tuple>

namespace seqio {

/** Represents genomic coordinates. */
typedef
unsigned long
TCoord;

/** Represents genomic regions (chromosome, start, end). */
typedef
std::tuple<
  std::string,
  TCoord,
  TCoord
>
TRegion;

/** Returns true if c is a valid nucleotide character (ACGTN, any case). */
inline bool isNuc(char c) {
  switch (c) {
    case 'A': case 'C': case 'G': case 'T': case 'N':
    case 'a': case 'c': case 'g': case 't': case 'n':
      return true;
    default:
      return false;
  }
}

} // namespace seqio

#endif // SEQIO_TYPES_H
