#ifndef LINKAGESCANNER_H
#define LINKAGESCANNER_H

#include "AlignmentReader.hpp"
#include "LinkageWriter.hpp"
#include "ReadScorer.hpp"
#include "../vario/PositionTable.hpp"
#include <string>
#include <vector>

namespace bamio {

/** Settings controlling record filtering and parallel scoring. */
struct ScanOptions
{
  int threads;              /** number of worker threads */
  unsigned batch_size;      /** records dispatched per batch */
  unsigned min_mapq;        /** minimum mapping quality */
  unsigned min_base_qual;   /** minimum base quality within a position (0: off) */
  bool include_secondary;   /** score secondary/supplementary alignments? */
  bool include_duplicates;  /** score duplicate/QC-fail reads? */
  int verbosity;            /** detail level of console output */

  ScanOptions();
};

/** Counters collected over a scan. */
struct ScanStats
{
  unsigned long num_records;    /** records read */
  unsigned long num_unmapped;   /** records without alignment */
  unsigned long num_filtered;   /** records removed by filters */
  unsigned long num_anomalies;  /** records skipped due to inconsistent CIGAR */
  unsigned long num_no_overlap; /** mapped records without positions of interest */
  unsigned long num_linked;     /** linkage records produced */
  unsigned long num_unsorted;   /** records starting before their predecessor */

  ScanStats();
  /** Human-readable multi-line summary. */
  std::string to_string() const;
};

/**
 * Streams alignment records through a ReadScorer.
 *
 * Records are read in file order and dispatched in batches to a pool of
 * OpenMP threads. Results are slotted by their input index and emitted to
 * the sink in input order once a batch completes. If a worker fails, the
 * rest of the batch is skipped, no further batch is dispatched and the
 * error is rethrown to the caller.
 */
class LinkageScanner
{
public:
  LinkageScanner(const vario::PositionTable& table, const ScanOptions& options);

  /** Process all records from source. Throws errors::DecodeError, errors::IoError. */
  ScanStats scan(RecordSource& source, LinkageSink& sink);

  /** Does record pass the mapping quality and flag filters? */
  bool passesFilters(const AlignmentRecord& rec) const;
  /** Filter and score a single record. */
  ScoreStatus process(const AlignmentRecord& rec, LinkageRecord& out_rec) const;

private:
  ScanOptions m_options;
  ReadScorer m_scorer;
}; /* class LinkageScanner */

} // namespace bamio

#endif // LINKAGESCANNER_H
