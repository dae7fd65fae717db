#include "AlignmentReader.hpp"
#include "../stringio.hpp"

using namespace std;
using errors::DecodeError;

namespace bamio {

AlignmentReader::AlignmentReader()
: m_is_open(false), m_num_recs(0)
{}

AlignmentReader::AlignmentReader(const string& filename)
: m_is_open(false), m_num_recs(0)
{
  this->open(filename);
}

void AlignmentReader::open(const string& filename) {
  m_filename = filename;
  if (!seqan::open(m_bam_in, filename.c_str())) {
    throw DecodeError(stringio::format("could not open alignment file '%s'", filename.c_str()));
  }
  // NOTE: reading the header first is MANDATORY! (advances file pointer)
  try {
    seqan::readHeader(m_header, m_bam_in);
  } catch (const std::exception& e) {
    throw DecodeError(stringio::format("%s: invalid header (%s)", filename.c_str(), e.what()));
  }
  m_is_open = true;
  m_num_recs = 0;
}

bool AlignmentReader::next(AlignmentRecord& out_rec) {
  if (!m_is_open) {
    throw DecodeError("alignment file not open");
  }
  try {
    if (seqan::atEnd(m_bam_in)) {
      return false;
    }
    seqan::readRecord(m_record, m_bam_in);
  } catch (const std::exception& e) {
    throw DecodeError(stringio::format("%s: record %lu could not be decoded (%s)",
                                       m_filename.c_str(), m_num_recs+1, e.what()));
  }
  this->convertRecord(out_rec);
  m_num_recs++;
  return true;
}

void AlignmentReader::convertRecord(AlignmentRecord& out_rec) {
  typedef seqan::BamAlignmentRecord TRecord;

  out_rec.read_id.assign(seqan::begin(m_record.qName), seqan::end(m_record.qName));
  out_rec.flag = m_record.flag;
  out_rec.mapq = m_record.mapQ;
  out_rec.begin_pos = m_record.beginPos;

  out_rec.chr.clear();
  if (m_record.rID != TRecord::INVALID_REFID) {
    auto& names = seqan::contigNames(seqan::context(m_bam_in));
    if (m_record.rID < 0 || static_cast<size_t>(m_record.rID) >= seqan::length(names)) {
      throw DecodeError(stringio::format("%s: record %lu refers to unknown reference id %d",
                                         m_filename.c_str(), m_num_recs+1, m_record.rID));
    }
    out_rec.chr = seqan::toCString(names[m_record.rID]);
  }
  out_rec.is_mapped = !seqan::hasFlagUnmapped(m_record)
                   && m_record.rID != TRecord::INVALID_REFID
                   && m_record.beginPos != TRecord::INVALID_POS;

  out_rec.cigar.clear();
  for (unsigned i=0; i<seqan::length(m_record.cigar); i++) {
    out_rec.cigar.push_back(CigarOp(m_record.cigar[i].operation, m_record.cigar[i].count));
  }

  out_rec.seq.clear();
  out_rec.seq.reserve(seqan::length(m_record.seq));
  for (unsigned i=0; i<seqan::length(m_record.seq); i++) {
    out_rec.seq.push_back(seqan::convert<char>(m_record.seq[i]));
  }

  out_rec.qual.assign(seqan::begin(m_record.qual), seqan::end(m_record.qual));
}

unsigned long AlignmentReader::numRecords() const {
  return m_num_recs;
}

vector<string> AlignmentReader::referenceNames() {
  vector<string> names;
  if (!m_is_open) return names;
  auto& contigs = seqan::contigNames(seqan::context(m_bam_in));
  for (unsigned i=0; i<seqan::length(contigs); i++) {
    names.push_back(seqan::toCString(contigs[i]));
  }
  return names;
}

} // namespace bamio
