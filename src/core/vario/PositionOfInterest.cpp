#include "PositionOfInterest.hpp"

using namespace std;
using seqio::TCoord;

namespace vario {

PositionOfInterest::PositionOfInterest()
: idx(0), line(0), start(0), end(0)
{}

PositionOfInterest::PositionOfInterest(
  string chr,
  TCoord start,
  TCoord end,
  string label,
  string wildtype,
  vector<string> mutants
)
: idx(0),
  line(0),
  chr(chr),
  start(start),
  end(end),
  label(label),
  wildtype(wildtype),
  mutants(mutants)
{}

TCoord PositionOfInterest::length() const {
  return (end > start ? end - start : 0);
}

seqio::Locus PositionOfInterest::locus() const {
  return seqio::Locus(chr, start, end);
}

bool PositionOfInterest::operator< (const PositionOfInterest& rhs) const {
  if (chr != rhs.chr) return chr < rhs.chr;
  if (start != rhs.start) return start < rhs.start;
  if (end != rhs.end) return end < rhs.end;
  return line < rhs.line;
}

} // namespace vario
