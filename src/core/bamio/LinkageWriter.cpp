#include "LinkageWriter.hpp"
#include "../stringio.hpp"
#include <boost/format.hpp>

using namespace std;
using boost::str;
using errors::IoError;
using vario::PositionCall;
namespace fs = boost::filesystem;

namespace bamio {

bool parseLayout(const string& name, OutputLayout& out_layout) {
  if (name == "variable") {
    out_layout = LAYOUT_VARIABLE;
  } else if (name == "superset") {
    out_layout = LAYOUT_SUPERSET;
  } else {
    return false;
  }
  return true;
}

string layoutName(const OutputLayout layout) {
  return (layout == LAYOUT_SUPERSET ? "superset" : "variable");
}

LinkageWriter::LinkageWriter(
  const fs::path& fn_out,
  const vario::PositionTable& table,
  const OutputLayout layout,
  const bool do_pattern_summary
)
: m_fn_out(fn_out),
  m_table(table),
  m_layout(layout),
  m_do_summary(do_pattern_summary),
  m_num_rows(0),
  m_has_partial(false)
{}

LinkageWriter::~LinkageWriter() {
  if (m_fs_out.is_open()) {
    m_fs_out.close();
  }
}

fs::path LinkageWriter::finalPath() const {
  return m_fn_out;
}

fs::path LinkageWriter::partialPath() const {
  return fs::path(m_fn_out.string() + ".partial");
}

fs::path LinkageWriter::summaryPath() const {
  fs::path p = m_fn_out;
  return p.replace_extension(".patterns.csv");
}

unsigned long LinkageWriter::numRows() const {
  return m_num_rows;
}

bool LinkageWriter::hasPartial() const {
  return m_has_partial;
}

string LinkageWriter::formatHeader(const string& version) const {
  string header = str(boost::format("# mutlink %s layout=%s\n") % version % layoutName(m_layout));
  vector<string> cols = { "read_id", "reference_name" };
  if (m_layout == LAYOUT_SUPERSET) {
    for (const vario::PositionOfInterest& pos : m_table.positions()) {
      cols.push_back(stringio::csvCell(pos.label));
    }
  } else {
    // column pairs repeat once per overlapped position
    cols.push_back("label");
    cols.push_back("outcome");
    cols.push_back("...");
  }
  cols.push_back("combined_pattern");
  header += stringio::join(cols, ",");
  return header;
}

string LinkageWriter::formatRow(const LinkageRecord& rec) const {
  vector<string> cells = { stringio::csvCell(rec.read_id), stringio::csvCell(rec.chr) };
  if (m_layout == LAYOUT_SUPERSET) {
    vector<string> outcomes(m_table.size(), "");
    for (const PositionCall& call : rec.calls) {
      outcomes[call.position->idx] = call.tag();
    }
    cells.insert(cells.end(), outcomes.begin(), outcomes.end());
  } else {
    for (const PositionCall& call : rec.calls) {
      cells.push_back(stringio::csvCell(call.position->label));
      cells.push_back(call.tag());
    }
  }
  cells.push_back(rec.combined_pattern);
  return stringio::join(cells, ",");
}

void LinkageWriter::open(const string& version) {
  fs::path fn_partial = this->partialPath();
  m_fs_out.open(fn_partial.string().c_str(), ios::out | ios::trunc);
  if (!m_fs_out.is_open()) {
    throw IoError(str(boost::format("could not create output file '%s'") % fn_partial.string()));
  }
  m_has_partial = true;
  m_fs_out << this->formatHeader(version) << '\n';
  if (m_fs_out.fail()) {
    throw IoError(str(boost::format("could not write to '%s'") % fn_partial.string()));
  }
}

void LinkageWriter::write(const LinkageRecord& rec) {
  if (!m_fs_out.is_open()) {
    throw IoError("output file not open");
  }
  m_fs_out << this->formatRow(rec) << '\n';
  if (m_fs_out.fail()) {
    throw IoError(str(boost::format("could not write to '%s'") % this->partialPath().string()));
  }
  m_num_rows++;
  if (m_do_summary) {
    m_map_pattern_count[make_tuple(rec.chr, rec.combined_pattern, rec.labels())]++;
  }
}

void LinkageWriter::writeSummary(const fs::path& fn_summary) {
  ofstream fs_summary(fn_summary.string().c_str(), ios::out | ios::trunc);
  if (!fs_summary.is_open()) {
    throw IoError(str(boost::format("could not create pattern summary '%s'") % fn_summary.string()));
  }
  fs_summary << "reference_name,combined_pattern,position_labels,read_count\n";
  for (const auto& kv : m_map_pattern_count) {
    fs_summary << stringio::csvCell(get<0>(kv.first)) << ','
               << get<1>(kv.first) << ','
               << stringio::csvCell(get<2>(kv.first)) << ','
               << kv.second << '\n';
  }
  fs_summary.close();
  if (fs_summary.fail()) {
    throw IoError(str(boost::format("could not write pattern summary '%s'") % fn_summary.string()));
  }
}

void LinkageWriter::close() {
  if (!m_fs_out.is_open()) {
    throw IoError("output file not open");
  }
  m_fs_out.close();
  if (m_fs_out.fail()) {
    throw IoError(str(boost::format("could not finish writing '%s'") % this->partialPath().string()));
  }

  // summary keeps its partial name until the main output is in place
  fs::path fn_summary_partial(this->summaryPath().string() + ".partial");
  if (m_do_summary) {
    this->writeSummary(fn_summary_partial);
  }

  boost::system::error_code ec;
  fs::rename(this->partialPath(), m_fn_out, ec);
  if (ec) {
    throw IoError(str(boost::format("could not rename '%s': %s") % this->partialPath().string() % ec.message()));
  }
  m_has_partial = false;

  if (m_do_summary) {
    fs::rename(fn_summary_partial, this->summaryPath(), ec);
    if (ec) {
      throw IoError(str(boost::format("could not rename '%s': %s") % fn_summary_partial.string() % ec.message()));
    }
  }
}

void LinkageWriter::abandon() {
  if (m_fs_out.is_open()) {
    m_fs_out.flush();
    m_fs_out.close();
  }
}

} // namespace bamio
