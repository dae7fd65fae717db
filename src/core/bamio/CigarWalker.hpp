#ifndef CIGARWALKER_H
#define CIGARWALKER_H

#include "AlignmentRecord.hpp"
#include "../seqio/types.hpp"
#include "../vario/AlleleClassifier.hpp"

namespace bamio {

/** Outcome of mapping one reference coordinate onto a read. */
enum MapStatus {
  MAP_READ_OFFSET,   // reference base aligned to a read base
  MAP_DELETED,       // reference base inside a deletion or reference skip
  MAP_CLIPPED,       // reference base would be covered only by clipped bases
  MAP_OUT_OF_RANGE   // reference base outside the read
};

/** Read offset for a reference coordinate, or the reason there is none. */
struct MappedCoord
{
  MapStatus status;
  seqio::TCoord offset; /** offset into read sequence (MAP_READ_OFFSET only) */

  MappedCoord() : status(MAP_OUT_OF_RANGE), offset(0) {}
  MappedCoord(MapStatus status, seqio::TCoord offset=0) : status(status), offset(offset) {}
};

/**
 * Map reference coordinate 'target' to an offset in the read sequence.
 *
 * Walks the operation list once. Operations consuming reference and read
 * (M, =, X) claim the target with an offset; operations consuming only
 * reference (D, N) claim it as deleted. Clipped bases never claim a target:
 * a target lying in the reference extension of a soft/hard clip reports
 * MAP_CLIPPED, anything further out MAP_OUT_OF_RANGE.
 */
MappedCoord mapReferenceCoordinate(
  const TCigar& cigar,
  const long ref_start,
  const seqio::TCoord target
);

/**
 * Extract the read bases aligned to reference span [start, end).
 *
 * Each reference offset is mapped individually. Any offset out of range or
 * clipped yields SPAN_OUT_OF_RANGE/SPAN_CLIPPED, then any deleted offset
 * SPAN_DELETED; read offsets that are not contiguous (an insertion inside
 * the span) yield SPAN_INSERTION. With min_base_qual > 0 and qualities
 * present, a base below the cutoff yields SPAN_LOW_QUALITY.
 */
vario::ExtractedBases extractBases(
  const AlignmentRecord& rec,
  const seqio::TCoord start,
  const seqio::TCoord end,
  const unsigned min_base_qual = 0
);

} // namespace bamio

#endif // CIGARWALKER_H
