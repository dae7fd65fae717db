#ifndef BEDFILE_H
#define BEDFILE_H

#include "types.hpp"
#include "Locus.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace seqio {

/** One positions-of-interest line, unvalidated apart from its syntax. */
struct PositionRow
{
  unsigned long line;               // 1-based line number in input file
  std::string seq_id;               // reference sequence name
  TCoord start;                     // 0-based, inclusive
  TCoord end;                       // 0-based, exclusive
  std::string label;
  std::string wildtype;
  std::vector<std::string> mutants;
};

/**
 * Handles input of positions-of-interest files (BED-derived).
 *
 * Expected tab-separated columns:
 *   1. seq_id   : Identifier for a sequence (e.g. chromosome)
 *   2. start    : Start coordinate (0-based, inclusive)
 *   3. end      : End coordinate (0-based, exclusive)
 *   4. label    : Name of the position
 *   5. wildtype : Wildtype allele
 *   6+. mutants : One or more mutant alleles
 *
 * Lines starting with '#' (and BED 'track'/'browser' lines) are comments.
 * Syntax errors raise errors::ValidationError naming line and field.
 */
struct BedFile {

/** Number of records in this BED file. */
size_t m_num_recs;
/** Line numbers of records. */
std::vector<unsigned long> m_vec_line;
/** Sequence IDs. */
std::vector<std::string> m_vec_seqid;
/** Start coordinates (0-based, inclusive). */
std::vector<TCoord> m_vec_start;
/** End coordinates (0-based, exclusive). */
std::vector<TCoord> m_vec_end;
/** Position labels. */
std::vector<std::string> m_vec_label;
/** Wildtype alleles. */
std::vector<std::string> m_vec_wt;
/** Mutant alleles (one or more per record). */
std::vector<std::vector<std::string>> m_vec_mut;

/** default c'tor */
BedFile();
/** Initialize from existing BED file. */
BedFile(const std::string& filename);

/** Get records from BED file. */
void parseBed(const std::string& filename);
/** Get records from input stream. */
void parseBed(std::istream& input);

/** Return records as list of PositionRow objects. */
void getPositionRows(std::vector<PositionRow>& out_rows) const;
/** Return genomic records as list of Locus objects. */
void getLoci(std::vector<Locus>& out_loci) const;

};

} /* namespace seqio */

#endif /* BEDFILE_H */
