#ifndef READSCORER_H
#define READSCORER_H

#include "AlignmentRecord.hpp"
#include "CigarWalker.hpp"
#include "../seqio/Locus.hpp"
#include "../vario/AlleleClassifier.hpp"
#include "../vario/PositionTable.hpp"
#include <string>
#include <vector>

namespace bamio {

/** Separator between outcome tags in a combined pattern. */
const char PATTERN_SEP = '|';

/** Per-read calls at all overlapped positions. */
struct LinkageRecord
{
  std::string read_id;
  std::string chr;
  seqio::Locus span;                      /** aligned reference span of the read */
  std::vector<vario::PositionCall> calls; /** one per overlapped position, ascending start */
  std::string combined_pattern;           /** outcome tags joined by PATTERN_SEP */

  /** Labels of the called positions joined by PATTERN_SEP. */
  std::string labels() const;
};

/** Result of scoring a single record. */
enum ScoreStatus {
  SCORE_LINKED,      // LinkageRecord produced
  SCORE_UNMAPPED,    // record is not mapped
  SCORE_NO_OVERLAP,  // no position of interest overlaps the read
  SCORE_ANOMALY,     // operation list inconsistent with the record; record skipped
  SCORE_FILTERED     // removed by record filters before scoring (see LinkageScanner)
};

/** Join outcome tags of calls in order. */
std::string combinePattern(const std::vector<vario::PositionCall>& calls);

/**
 * Scores alignment records against a fixed set of positions of interest.
 *
 * score() depends only on its record argument and the (immutable) table,
 * so a single ReadScorer may be shared by any number of threads.
 */
class ReadScorer
{
public:
  ReadScorer(const vario::PositionTable& table, const unsigned min_base_qual = 0);

  /**
   * Score one alignment record.
   * \param rec      decoded alignment
   * \param out_rec  filled if SCORE_LINKED is returned
   */
  ScoreStatus score(const AlignmentRecord& rec, LinkageRecord& out_rec) const;

  /**
   * Check that a mapped record's operations are consistent with the record.
   * \param out_reason  description of the inconsistency (if any)
   * \returns true if the record can be scored
   */
  static bool checkCoordinates(const AlignmentRecord& rec, std::string& out_reason);

  const vario::PositionTable& table() const { return m_table; }

private:
  const vario::PositionTable& m_table;
  unsigned m_min_base_qual;
}; /* class ReadScorer */

} // namespace bamio

#endif // READSCORER_H
