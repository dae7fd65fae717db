#include "BedFile.hpp"

using namespace std;
using errors::ValidationError;

namespace seqio {

namespace {
const size_t min_columns = 6;
const char* col_names[] = { "reference_name", "start", "end", "label", "wildtype_allele" };

/** BED header line: keyword is the whole first field. */
bool isHeaderLine(const string& line, const string& keyword) {
  if (line.compare(0, keyword.size(), keyword) != 0) return false;
  if (line.size() == keyword.size()) return true;
  const char next = line[keyword.size()];
  return (next == ' ' || next == '\t');
}
}

BedFile::BedFile() :
  m_num_recs(0)
{}

BedFile::BedFile(const string& filename) :
  m_num_recs(0)
{
  this->parseBed(filename);
}

void
BedFile::parseBed(const string& filename) {
  ifstream inputFile;
  inputFile.open(filename, ios::in);
  if (!inputFile.is_open()) {
    throw ValidationError(stringio::format("could not open positions file '%s'", filename.c_str()));
  }
  this->parseBed(inputFile);
  inputFile.close();
}

void
BedFile::parseBed(istream& input) {
  string line;
  unsigned long num_line = 0;

  for (stringio::safeGetline(input, line); input.good(); stringio::safeGetline(input, line)) {
    num_line++;
    // skip comments and empty lines
    if (stringio::trim(line).empty()) continue;
    if (line[0] == '#') continue;
    if (isHeaderLine(line, "track") || isHeaderLine(line, "browser")) continue;

    // split line into fields
    vector<string> row = stringio::split(line, '\t');
    if (row.size() < min_columns) {
      string field = (row.size() < 5 ? col_names[row.size()] : "mutant_allele_1");
      throw ValidationError(
        stringio::format("expected >=%zu tab-separated columns, found %zu", min_columns, row.size()),
        num_line, field);
    }
    for (string& f : row) f = stringio::trim(f);

    if (row[0].empty()) {
      throw ValidationError("empty reference name", num_line, col_names[0]);
    }
    unsigned long start = 0, end = 0;
    if (!stringio::parseUlong(row[1], start)) {
      throw ValidationError(stringio::format("not a non-negative integer: '%s'", row[1].c_str()), num_line, col_names[1]);
    }
    if (!stringio::parseUlong(row[2], end)) {
      throw ValidationError(stringio::format("not a non-negative integer: '%s'", row[2].c_str()), num_line, col_names[2]);
    }
    if (row[3].empty()) {
      throw ValidationError("empty label", num_line, col_names[3]);
    }

    this->m_vec_line.push_back(num_line);
    this->m_vec_seqid.push_back(row[0]);
    this->m_vec_start.push_back(start);
    this->m_vec_end.push_back(end);
    this->m_vec_label.push_back(row[3]);
    this->m_vec_wt.push_back(row[4]);
    this->m_vec_mut.push_back(vector<string>(row.begin()+5, row.end()));
    this->m_num_recs++;
  }
}

void BedFile::getPositionRows ( vector<PositionRow>& out_rows ) const {
  out_rows.clear();
  for (size_t i=0; i<this->m_num_recs; i++) {
    PositionRow r;
    r.line = this->m_vec_line[i];
    r.seq_id = this->m_vec_seqid[i];
    r.start = this->m_vec_start[i];
    r.end = this->m_vec_end[i];
    r.label = this->m_vec_label[i];
    r.wildtype = this->m_vec_wt[i];
    r.mutants = this->m_vec_mut[i];
    out_rows.push_back(r);
  }
}

void BedFile::getLoci ( vector<Locus>& out_loci ) const {
  out_loci.clear();
  for (size_t i=0; i<this->m_num_recs; i++) {
    out_loci.push_back(Locus(this->m_vec_seqid[i], this->m_vec_start[i], this->m_vec_end[i]));
  }
}

} /* namespace seqio */
