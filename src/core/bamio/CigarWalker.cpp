#include "CigarWalker.hpp"

using namespace std;
using seqio::TCoord;
using vario::ExtractedBases;

namespace bamio {

namespace {

bool isClip(const char op) {
  return (op == 'S' || op == 'H');
}

/** Total length of clips preceding the first reference-consuming operation. */
TCoord leadingClipLength(const TCigar& cigar) {
  TCoord len = 0;
  for (const CigarOp& op : cigar) {
    if (consumesReference(op.operation)) break;
    if (isClip(op.operation)) len += op.count;
  }
  return len;
}

/** Total length of clips following the last reference-consuming operation. */
TCoord trailingClipLength(const TCigar& cigar) {
  TCoord len = 0;
  for (auto it = cigar.rbegin(); it != cigar.rend(); ++it) {
    if (consumesReference(it->operation)) break;
    if (isClip(it->operation)) len += it->count;
  }
  return len;
}

} // namespace

MappedCoord mapReferenceCoordinate(
  const TCigar& cigar,
  const long ref_start,
  const TCoord target
)
{
  if (ref_start < 0) {
    return MappedCoord(MAP_OUT_OF_RANGE);
  }
  TCoord ref_cursor = static_cast<TCoord>(ref_start);
  if (target < ref_cursor) {
    TCoord clip_len = leadingClipLength(cigar);
    return MappedCoord(ref_cursor - target <= clip_len ? MAP_CLIPPED : MAP_OUT_OF_RANGE);
  }

  TCoord read_cursor = 0;
  for (const CigarOp& op : cigar) {
    const bool on_ref = consumesReference(op.operation);
    const bool on_read = consumesRead(op.operation);
    if (on_ref) {
      if (target < ref_cursor + op.count) {
        if (on_read) {
          return MappedCoord(MAP_READ_OFFSET, read_cursor + (target - ref_cursor));
        }
        return MappedCoord(MAP_DELETED);
      }
      ref_cursor += op.count;
    }
    if (on_read) {
      read_cursor += op.count;
    }
  }

  // walked past the aligned part of the read
  TCoord clip_len = trailingClipLength(cigar);
  return MappedCoord(target - ref_cursor < clip_len ? MAP_CLIPPED : MAP_OUT_OF_RANGE);
}

ExtractedBases extractBases(
  const AlignmentRecord& rec,
  const TCoord start,
  const TCoord end,
  const unsigned min_base_qual
)
{
  if (end <= start) {
    return ExtractedBases(vario::SPAN_OUT_OF_RANGE);
  }

  bool is_clipped = false;
  bool is_deleted = false;
  bool is_contiguous = true;
  TCoord first_offset = 0;
  TCoord prev_offset = 0;
  for (TCoord target = start; target < end; target++) {
    MappedCoord mc = mapReferenceCoordinate(rec.cigar, rec.begin_pos, target);
    switch (mc.status) {
      case MAP_OUT_OF_RANGE:
        return ExtractedBases(vario::SPAN_OUT_OF_RANGE);
      case MAP_CLIPPED:
        is_clipped = true;
        break;
      case MAP_DELETED:
        is_deleted = true;
        break;
      case MAP_READ_OFFSET:
        if (target == start) {
          first_offset = mc.offset;
        } else if (mc.offset != prev_offset + 1) {
          is_contiguous = false;
        }
        prev_offset = mc.offset;
        break;
    }
  }
  if (is_clipped) return ExtractedBases(vario::SPAN_CLIPPED);
  if (is_deleted) return ExtractedBases(vario::SPAN_DELETED);
  if (!is_contiguous) return ExtractedBases(vario::SPAN_INSERTION);

  const TCoord len = end - start;
  if (first_offset + len > rec.seq.size()) {
    // no stored sequence for these bases
    return ExtractedBases(vario::SPAN_OUT_OF_RANGE);
  }
  if (min_base_qual > 0 && rec.qual.size() == rec.seq.size()) {
    for (TCoord i = first_offset; i < first_offset + len; i++) {
      int phred = static_cast<int>(static_cast<unsigned char>(rec.qual[i])) - 33;
      if (phred < static_cast<int>(min_base_qual)) {
        return ExtractedBases(vario::SPAN_LOW_QUALITY);
      }
    }
  }
  return ExtractedBases(rec.seq.substr(first_offset, len));
}

} // namespace bamio
