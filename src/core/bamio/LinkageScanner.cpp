#include "LinkageScanner.hpp"
#include "../stringio.hpp"
#include <exception>
#include <omp.h>

using namespace std;

namespace bamio {

ScanOptions::ScanOptions()
: threads(1),
  batch_size(10000),
  min_mapq(0),
  min_base_qual(0),
  include_secondary(false),
  include_duplicates(false),
  verbosity(1)
{}

ScanStats::ScanStats()
: num_records(0),
  num_unmapped(0),
  num_filtered(0),
  num_anomalies(0),
  num_no_overlap(0),
  num_linked(0),
  num_unsorted(0)
{}

string ScanStats::to_string() const {
  string s;
  s += stringio::format("  records read:\t\t%lu\n", num_records);
  s += stringio::format("  unmapped:\t\t%lu\n", num_unmapped);
  s += stringio::format("  filtered:\t\t%lu\n", num_filtered);
  s += stringio::format("  CIGAR anomalies:\t%lu\n", num_anomalies);
  s += stringio::format("  no overlap:\t\t%lu\n", num_no_overlap);
  s += stringio::format("  linkage records:\t%lu\n", num_linked);
  s += stringio::format("  unsorted:\t\t%lu\n", num_unsorted);
  return s;
}

LinkageScanner::LinkageScanner(const vario::PositionTable& table, const ScanOptions& options)
: m_options(options),
  m_scorer(table, options.min_base_qual)
{
  if (m_options.threads < 1) m_options.threads = 1;
  if (m_options.batch_size < 1) m_options.batch_size = 1;
}

bool LinkageScanner::passesFilters(const AlignmentRecord& rec) const {
  if (rec.mapq < m_options.min_mapq) return false;
  if (!m_options.include_secondary && (rec.isSecondary() || rec.isSupplementary())) return false;
  if (!m_options.include_duplicates && (rec.isDuplicate() || rec.isQcFail())) return false;
  return true;
}

ScoreStatus LinkageScanner::process(const AlignmentRecord& rec, LinkageRecord& out_rec) const {
  if (!rec.is_mapped) {
    return SCORE_UNMAPPED;
  }
  if (!this->passesFilters(rec)) {
    return SCORE_FILTERED;
  }
  return m_scorer.score(rec, out_rec);
}

ScanStats LinkageScanner::scan(RecordSource& source, LinkageSink& sink) {
  ScanStats stats;
  const size_t batch_size = m_options.batch_size;
  vector<AlignmentRecord> vec_rec(batch_size);
  vector<LinkageRecord> vec_link(batch_size);
  vector<ScoreStatus> vec_status(batch_size, SCORE_UNMAPPED);

  string prev_chr;
  long prev_pos = -1;
  bool warned_unsorted = false;

  while (true) {
    // fill next batch in file order (DecodeError propagates, stopping dispatch)
    size_t num_batch = 0;
    while (num_batch < batch_size && source.next(vec_rec[num_batch])) {
      num_batch++;
    }
    if (num_batch == 0) break;

    // score batch in parallel
    bool is_cancelled = false;
    exception_ptr worker_error;
    const long n = static_cast<long>(num_batch);
    #pragma omp parallel for schedule(dynamic, 64) num_threads(m_options.threads)
    for (long i=0; i<n; i++) {
      bool skip;
      #pragma omp atomic read
      skip = is_cancelled;
      if (skip) continue;
      try {
        vec_status[i] = this->process(vec_rec[i], vec_link[i]);
      } catch (...) {
        #pragma omp critical(scan_error)
        {
          if (!worker_error) worker_error = current_exception();
        }
        #pragma omp atomic write
        is_cancelled = true;
      }
    }
    if (worker_error) {
      rethrow_exception(worker_error);
    }

    // emit results in input order
    for (size_t i=0; i<num_batch; i++) {
      const AlignmentRecord& rec = vec_rec[i];
      stats.num_records++;
      if (rec.is_mapped) {
        if (rec.chr == prev_chr && rec.begin_pos < prev_pos) {
          stats.num_unsorted++;
          if (!warned_unsorted && m_options.verbosity > 0) {
            fprintf(stderr, "[WARN] (LinkageScanner) Input not coordinate-sorted (read '%s' at %s:%ld).\n",
                    rec.read_id.c_str(), rec.chr.c_str(), rec.begin_pos);
            warned_unsorted = true;
          }
        }
        prev_chr = rec.chr;
        prev_pos = rec.begin_pos;
      }
      switch (vec_status[i]) {
        case SCORE_LINKED:
          sink.write(vec_link[i]);
          stats.num_linked++;
          break;
        case SCORE_UNMAPPED:
          stats.num_unmapped++;
          break;
        case SCORE_FILTERED:
          stats.num_filtered++;
          break;
        case SCORE_NO_OVERLAP:
          stats.num_no_overlap++;
          break;
        case SCORE_ANOMALY:
          stats.num_anomalies++;
          if (m_options.verbosity >= 2) {
            string reason;
            ReadScorer::checkCoordinates(rec, reason);
            fprintf(stderr, "[WARN] (LinkageScanner) Skipping read '%s': %s\n",
                    rec.read_id.c_str(), reason.c_str());
          }
          break;
      }
    }
  }

  return stats;
}

} // namespace bamio
