#include "ReadScorer.hpp"
#include "../stringio.hpp"

using namespace std;
using seqio::TCoord;
using vario::PositionCall;
using vario::PositionOfInterest;

namespace bamio {

string LinkageRecord::labels() const {
  string res;
  for (size_t i=0; i<calls.size(); i++) {
    if (i > 0) res += PATTERN_SEP;
    res += calls[i].position->label;
  }
  return res;
}

string combinePattern(const vector<PositionCall>& calls) {
  string res;
  for (size_t i=0; i<calls.size(); i++) {
    if (i > 0) res += PATTERN_SEP;
    res += calls[i].tag();
  }
  return res;
}

ReadScorer::ReadScorer(const vario::PositionTable& table, const unsigned min_base_qual)
: m_table(table), m_min_base_qual(min_base_qual)
{}

bool ReadScorer::checkCoordinates(const AlignmentRecord& rec, string& out_reason) {
  if (rec.begin_pos < 0) {
    out_reason = "negative start position";
    return false;
  }
  if (rec.cigar.empty()) {
    out_reason = "empty CIGAR for mapped read";
    return false;
  }
  for (const CigarOp& op : rec.cigar) {
    if (!isValidOperation(op.operation)) {
      out_reason = stringio::format("unknown CIGAR operation '%c'", op.operation);
      return false;
    }
    if (op.count == 0) {
      out_reason = stringio::format("zero-length CIGAR operation '%c'", op.operation);
      return false;
    }
  }
  if (referenceLength(rec.cigar) == 0) {
    out_reason = "CIGAR consumes no reference bases";
    return false;
  }
  TCoord len_query = queryLength(rec.cigar);
  if (!rec.seq.empty() && len_query != rec.seq.size()) {
    out_reason = stringio::format("CIGAR %s implies %lu read bases, sequence has %zu",
                                  cigarToString(rec.cigar).c_str(), len_query, rec.seq.size());
    return false;
  }
  return true;
}

ScoreStatus ReadScorer::score(const AlignmentRecord& rec, LinkageRecord& out_rec) const {
  if (!rec.is_mapped) {
    return SCORE_UNMAPPED;
  }
  string reason;
  if (!checkCoordinates(rec, reason)) {
    return SCORE_ANOMALY;
  }

  const TCoord ref_start = static_cast<TCoord>(rec.begin_pos);
  const TCoord ref_end = ref_start + referenceLength(rec.cigar);
  vector<const PositionOfInterest*> vec_pos;
  if (m_table.overlapping(rec.chr, ref_start, ref_end, vec_pos) == 0) {
    return SCORE_NO_OVERLAP;
  }

  out_rec.read_id = rec.read_id;
  out_rec.chr = rec.chr;
  out_rec.span = seqio::Locus(rec.chr, ref_start, ref_end);
  out_rec.calls.clear();
  out_rec.calls.reserve(vec_pos.size());
  for (const PositionOfInterest* pos : vec_pos) {
    vario::ExtractedBases bases = extractBases(rec, pos->start, pos->end, m_min_base_qual);
    out_rec.calls.push_back(vario::classify(bases, *pos));
  }
  out_rec.combined_pattern = combinePattern(out_rec.calls);

  return SCORE_LINKED;
}

} // namespace bamio
