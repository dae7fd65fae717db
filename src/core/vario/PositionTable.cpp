#include "PositionTable.hpp"
#include "../stringio.hpp"
#include <algorithm>
#include <set>

using namespace std;
using errors::ValidationError;
using seqio::PositionRow;
using seqio::TCoord;

namespace vario {

PositionTable::PositionTable() {}

PositionTable::PositionTable(const vector<PositionRow>& rows) {
  for (const PositionRow& row : rows) {
    validateRow(row);
    vector<string> mutants;
    for (const string& m : row.mutants) {
      mutants.push_back(stringio::toUpper(m));
    }
    PositionOfInterest pos(row.seq_id, row.start, row.end, row.label,
                           stringio::toUpper(row.wildtype), mutants);
    pos.line = row.line;
    m_vec_pos.push_back(pos);
  }

  // stable order: reference name, start, end, input order
  stable_sort(m_vec_pos.begin(), m_vec_pos.end());

  // index reference blocks, compute running max of end coordinates
  m_vec_max_end.resize(m_vec_pos.size());
  size_t i = 0;
  while (i < m_vec_pos.size()) {
    size_t first = i;
    TCoord max_end = 0;
    const string& chr = m_vec_pos[first].chr;
    while (i < m_vec_pos.size() && m_vec_pos[i].chr == chr) {
      m_vec_pos[i].idx = static_cast<unsigned>(i);
      max_end = max(max_end, m_vec_pos[i].end);
      m_vec_max_end[i] = max_end;
      i++;
    }
    m_map_chr2range[chr] = make_pair(first, i);
  }
}

PositionTable PositionTable::build(const vector<PositionRow>& rows) {
  return PositionTable(rows);
}

void PositionTable::validateRow(const PositionRow& row) {
  if (row.end <= row.start) {
    throw ValidationError(
      stringio::format("end (%lu) must be greater than start (%lu)", row.end, row.start),
      row.line, "end");
  }
  if (row.mutants.empty()) {
    throw ValidationError("at least one mutant allele required", row.line, "mutant_allele_1");
  }
  const TCoord span = row.end - row.start;

  // collect all alleles with their column names
  vector<pair<string, string>> alleles;
  alleles.push_back(make_pair(string("wildtype_allele"), row.wildtype));
  for (size_t i=0; i<row.mutants.size(); i++) {
    alleles.push_back(make_pair(stringio::format("mutant_allele_%zu", i+1), row.mutants[i]));
  }

  set<string> seen;
  for (const auto& a : alleles) {
    const string& field = a.first;
    const string& allele = a.second;
    if (allele.empty()) {
      throw ValidationError("empty allele", row.line, field);
    }
    for (char c : allele) {
      if (!seqio::isNuc(c)) {
        throw ValidationError(
          stringio::format("invalid base '%c' in allele '%s'", c, allele.c_str()),
          row.line, field);
      }
    }
    if (allele.size() != span) {
      throw ValidationError(
        stringio::format("allele '%s' has length %zu, span is %lu", allele.c_str(), allele.size(), span),
        row.line, field);
    }
    if (!seen.insert(stringio::toUpper(allele)).second) {
      throw ValidationError(
        stringio::format("duplicate allele '%s'", allele.c_str()),
        row.line, field);
    }
  }
}

size_t PositionTable::overlapping(
  const string& chr,
  const TCoord start,
  const TCoord end,
  vector<const PositionOfInterest*>& out_pos
) const
{
  if (end <= start) return 0;
  auto it_chr = m_map_chr2range.find(chr);
  if (it_chr == m_map_chr2range.end()) {
    return 0; // no positions for this reference sequence
  }
  const size_t first = it_chr->second.first;
  const size_t last = it_chr->second.second;

  // first candidate: any position up to here ending after 'start'
  auto it_begin = m_vec_max_end.begin() + first;
  auto it_end = m_vec_max_end.begin() + last;
  size_t i = upper_bound(it_begin, it_end, start) - m_vec_max_end.begin();

  size_t num_found = 0;
  for (; i < last && m_vec_pos[i].start < end; i++) {
    if (m_vec_pos[i].end > start) {
      out_pos.push_back(&m_vec_pos[i]);
      num_found++;
    }
  }
  return num_found;
}

size_t PositionTable::overlapping(
  const seqio::Locus& locus,
  vector<const PositionOfInterest*>& out_pos
) const
{
  return overlapping(locus.id_ref, locus.start, locus.end, out_pos);
}

size_t PositionTable::size() const {
  return m_vec_pos.size();
}

const vector<PositionOfInterest>& PositionTable::positions() const {
  return m_vec_pos;
}

vector<string> PositionTable::referenceNames() const {
  vector<string> names;
  for (const auto& kv : m_map_chr2range) {
    names.push_back(kv.first);
  }
  return names;
}

bool PositionTable::hasReference(const string& chr) const {
  return m_map_chr2range.find(chr) != m_map_chr2range.end();
}

} // namespace vario
