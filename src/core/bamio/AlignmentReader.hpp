#ifndef ALIGNMENTREADER_H
#define ALIGNMENTREADER_H

#include "AlignmentRecord.hpp"
#include "../errors.hpp"
#include <seqan/bam_io.h>
#include <string>
#include <vector>

namespace bamio {

/** Sequential source of decoded alignment records. */
class RecordSource
{
public:
  virtual ~RecordSource() {}
  /**
   * Fetch the next record.
   * \returns false when the input is exhausted
   * \throws errors::DecodeError on corrupt or truncated input
   */
  virtual bool next(AlignmentRecord& out_rec) = 0;
};

/**
 * Reads SAM/BAM files in file order (no index needed), converting
 * each record into an AlignmentRecord.
 */
class AlignmentReader : public RecordSource
{
public:
  AlignmentReader();
  /** Open file and read header. Throws errors::DecodeError. */
  AlignmentReader(const std::string& filename);

  /** Open file and read header. Throws errors::DecodeError. */
  void open(const std::string& filename);
  /** Read next record. Throws errors::DecodeError. */
  bool next(AlignmentRecord& out_rec);

  /** Number of records read so far. */
  unsigned long numRecords() const;
  /** Reference sequence names listed in the header. */
  std::vector<std::string> referenceNames();

private:
  std::string m_filename;
  bool m_is_open;
  unsigned long m_num_recs;
  seqan::BamFileIn m_bam_in;
  seqan::BamHeader m_header;
  seqan::BamAlignmentRecord m_record; /** reused decoding buffer */

  void convertRecord(AlignmentRecord& out_rec);
}; /* class AlignmentReader */

} // namespace bamio

#endif // ALIGNMENTREADER_H
