#ifndef LINKAGEWRITER_H
#define LINKAGEWRITER_H

#include "ReadScorer.hpp"
#include "../errors.hpp"
#include "../vario/PositionTable.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace bamio {

/** Column layout of the CSV output. */
enum OutputLayout {
  LAYOUT_VARIABLE, // one (label, outcome) column pair per overlapped position
  LAYOUT_SUPERSET  // one column per position in the table, empty if not overlapped
};

/** Parse layout name ("variable", "superset"); false if unknown. */
bool parseLayout(const std::string& name, OutputLayout& out_layout);
/** Name of a layout. */
std::string layoutName(const OutputLayout layout);

/** Consumer of linkage records (single writer). */
class LinkageSink
{
public:
  virtual ~LinkageSink() {}
  /** Consume one record. Throws errors::IoError on failure. */
  virtual void write(const LinkageRecord& rec) = 0;
};

/**
 * Writes linkage records to a CSV file.
 *
 * Rows go to '<output>.partial' first. Only close() renames the file to
 * its final name; an aborted run leaves the '.partial' file behind.
 * Optionally counts reads per (reference, pattern) and writes them to
 * '<output>.patterns.csv' on close().
 */
class LinkageWriter : public LinkageSink
{
public:
  LinkageWriter(
    const boost::filesystem::path& fn_out,
    const vario::PositionTable& table,
    const OutputLayout layout = LAYOUT_VARIABLE,
    const bool do_pattern_summary = true
  );
  ~LinkageWriter();

  /** Create partial output file and write header. Throws errors::IoError. */
  void open(const std::string& version);
  /** Write one CSV row. Throws errors::IoError. */
  void write(const LinkageRecord& rec);
  /** Flush, write pattern summary, move files to final names. Throws errors::IoError. */
  void close();
  /** Close output, leaving the partial file in place. */
  void abandon();

  /** Format the header lines (layout comment + column names). */
  std::string formatHeader(const std::string& version) const;
  /** Format a single CSV row (without line break). */
  std::string formatRow(const LinkageRecord& rec) const;

  unsigned long numRows() const;
  /** True if a '.partial' output file was created and not yet moved to its final name. */
  bool hasPartial() const;
  boost::filesystem::path finalPath() const;
  boost::filesystem::path partialPath() const;
  boost::filesystem::path summaryPath() const;

private:
  boost::filesystem::path m_fn_out;
  const vario::PositionTable& m_table;
  OutputLayout m_layout;
  bool m_do_summary;
  std::ofstream m_fs_out;
  unsigned long m_num_rows;
  bool m_has_partial;
  /** read counts by (reference, pattern, labels) */
  std::map<std::tuple<std::string, std::string, std::string>, unsigned long> m_map_pattern_count;

  void writeSummary(const boost::filesystem::path& fn_summary);
}; /* class LinkageWriter */

} // namespace bamio

#endif // LINKAGEWRITER_H
