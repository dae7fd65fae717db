#ifndef POSITIONTABLE_H
#define POSITIONTABLE_H

#include "PositionOfInterest.hpp"
#include "../errors.hpp"
#include "../seqio/BedFile.hpp"
#include "../seqio/Locus.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vario {

/**
 * Immutable collection of positions of interest, grouped by reference
 * sequence and sorted by start coordinate within each group.
 *
 * Once built, a PositionTable is never modified; concurrent overlap
 * queries from several threads need no locking.
 */
class PositionTable
{
public:
  /** Empty table. */
  PositionTable();
  /** Validate rows and build table. Throws errors::ValidationError. */
  PositionTable(const std::vector<seqio::PositionRow>& rows);

  /** Validate rows and build table. Throws errors::ValidationError. */
  static PositionTable build(const std::vector<seqio::PositionRow>& rows);

  /**
   * Collect positions on 'chr' whose [start,end) intersects [start,end).
   * Results are appended to out_pos in ascending start order.
   * \returns number of positions found
   */
  size_t overlapping(
    const std::string& chr,
    const seqio::TCoord start,
    const seqio::TCoord end,
    std::vector<const PositionOfInterest*>& out_pos
  ) const;
  /** Collect positions overlapping a locus (see above). */
  size_t overlapping(
    const seqio::Locus& locus,
    std::vector<const PositionOfInterest*>& out_pos
  ) const;

  /** Total number of positions. */
  size_t size() const;
  /** All positions in table order (reference name, start, end, input order). */
  const std::vector<PositionOfInterest>& positions() const;
  /** Names of reference sequences with at least one position. */
  std::vector<std::string> referenceNames() const;
  /** True if positions exist on the given reference sequence. */
  bool hasReference(const std::string& chr) const;

private:
  /** Positions sorted by (chr, start, end, line). */
  std::vector<PositionOfInterest> m_vec_pos;
  /** Running maximum of end coordinates within each reference block. */
  std::vector<seqio::TCoord> m_vec_max_end;
  /** Index range [first, last) of each reference block in m_vec_pos. */
  std::map<std::string, std::pair<size_t, size_t>> m_map_chr2range;

  static void validateRow(const seqio::PositionRow& row);
}; /* class PositionTable */

} // namespace vario

#endif // POSITIONTABLE_H
