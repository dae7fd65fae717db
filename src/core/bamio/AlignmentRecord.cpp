#include "AlignmentRecord.hpp"
#include <cctype>

using namespace std;
using seqio::TCoord;

namespace bamio {

AlignmentRecord::AlignmentRecord()
: begin_pos(-1), flag(0), mapq(0), is_mapped(false)
{}

bool AlignmentRecord::isSecondary() const { return (flag & FLAG_SECONDARY) != 0; }
bool AlignmentRecord::isSupplementary() const { return (flag & FLAG_SUPPLEMENTARY) != 0; }
bool AlignmentRecord::isDuplicate() const { return (flag & FLAG_DUPLICATE) != 0; }
bool AlignmentRecord::isQcFail() const { return (flag & FLAG_QC_FAIL) != 0; }

bool consumesReference(const char op) {
  switch (op) {
    case 'M': case 'D': case 'N': case '=': case 'X':
      return true;
    default:
      return false;
  }
}

bool consumesRead(const char op) {
  switch (op) {
    case 'M': case 'I': case 'S': case '=': case 'X':
      return true;
    default:
      return false;
  }
}

bool isValidOperation(const char op) {
  switch (op) {
    case 'M': case 'I': case 'D': case 'N': case 'S':
    case 'H': case 'P': case '=': case 'X':
      return true;
    default:
      return false;
  }
}

TCoord referenceLength(const TCigar& cigar) {
  TCoord len = 0;
  for (const CigarOp& op : cigar) {
    if (consumesReference(op.operation)) len += op.count;
  }
  return len;
}

TCoord queryLength(const TCigar& cigar) {
  TCoord len = 0;
  for (const CigarOp& op : cigar) {
    if (consumesRead(op.operation)) len += op.count;
  }
  return len;
}

bool parseCigar(const string& str, TCigar& out_cigar) {
  out_cigar.clear();
  if (str == "*") return true;
  unsigned long count = 0;
  bool has_digits = false;
  for (char c : str) {
    if (isdigit(static_cast<unsigned char>(c))) {
      count = count*10 + (c - '0');
      if (count > 0xFFFFFFFUL) return false; // BAM limits op length to 28 bits
      has_digits = true;
    } else {
      if (!has_digits || !isValidOperation(c)) return false;
      out_cigar.push_back(CigarOp(c, static_cast<unsigned>(count)));
      count = 0;
      has_digits = false;
    }
  }
  return !has_digits;
}

string cigarToString(const TCigar& cigar) {
  if (cigar.empty()) return "*";
  string res;
  for (const CigarOp& op : cigar) {
    res += to_string(op.count);
    res += op.operation;
  }
  return res;
}

} // namespace bamio
