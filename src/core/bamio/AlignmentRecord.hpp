#ifndef ALIGNMENTRECORD_H
#define ALIGNMENTRECORD_H

#include "../seqio/types.hpp"
#include <string>
#include <vector>

namespace bamio {

/** One CIGAR operation (e.g. 'M', 50). */
struct CigarOp
{
  char operation;
  unsigned count;

  CigarOp() : operation('M'), count(0) {}
  CigarOp(char operation, unsigned count) : operation(operation), count(count) {}
};

/** Ordered CIGAR operation list. */
typedef std::vector<CigarOp> TCigar;

/** SAM flag bits used for record filtering. */
enum SamFlag {
  FLAG_UNMAPPED      = 0x4,
  FLAG_SECONDARY     = 0x100,
  FLAG_QC_FAIL       = 0x200,
  FLAG_DUPLICATE     = 0x400,
  FLAG_SUPPLEMENTARY = 0x800
};

/**
 * A single decoded alignment, independent of the container format.
 * Records are read-only input to scoring and never retained past the
 * current iteration step.
 */
struct AlignmentRecord
{
  std::string read_id;  /** read name (QNAME) */
  std::string chr;      /** reference sequence name (empty if unmapped) */
  long begin_pos;       /** 0-based leftmost reference position, -1 if unavailable */
  TCigar cigar;         /** alignment operations */
  std::string seq;      /** read bases (empty if not stored) */
  std::string qual;     /** phred+33 base qualities (empty if not stored) */
  unsigned flag;        /** SAM flag word */
  unsigned mapq;        /** mapping quality */
  bool is_mapped;       /** false for unplaced reads */

  AlignmentRecord();

  bool isSecondary() const;
  bool isSupplementary() const;
  bool isDuplicate() const;
  bool isQcFail() const;
};

/** Does this operation advance the reference cursor? (M, D, N, =, X) */
bool consumesReference(const char op);
/** Does this operation advance the read cursor? (M, I, S, =, X) */
bool consumesRead(const char op);
/** Is this one of the nine operations defined for SAM? */
bool isValidOperation(const char op);

/** Sum of reference-consuming operation lengths. */
seqio::TCoord referenceLength(const TCigar& cigar);
/** Sum of read-consuming operation lengths. */
seqio::TCoord queryLength(const TCigar& cigar);

/** Parse CIGAR string (e.g. "30M5D20M"); returns false on syntax errors. */
bool parseCigar(const std::string& str, TCigar& out_cigar);
/** Format CIGAR as string ("*" if empty). */
std::string cigarToString(const TCigar& cigar);

} // namespace bamio

#endif // ALIGNMENTRECORD_H
