#include "stringio.hpp"
#include <cctype>
#include <climits>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
    stringstream ss(s);
    string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    // keep trailing empty field ("a\tb\t" has three fields)
    if (!s.empty() && s[s.size()-1] == delim) {
        elems.push_back("");
    }
    return elems;
}

vector<string> split(const string &s, char delim) {
    vector<string> elems;
    split(s, delim, elems);
    return elems;
}

string join(const vector<string>& elems, const string& sep) {
  string res;
  for (size_t i=0; i<elems.size(); i++) {
    if (i > 0) res += sep;
    res += elems[i];
  }
  return res;
}

/** Deals with different line endings used on Linux, Mac, Windows platforms */
istream& safeGetline(istream& is, string& t)
{
    t.clear();

    // The characters in the stream are read one-by-one using a std::streambuf.
    // Code that uses streambuf this way must be guarded by a sentry object.
    istream::sentry se(is, true);
    streambuf* sb = is.rdbuf();

    for(;;) {
        int c = sb->sbumpc();
        switch (c) {
        case '\n':
            return is;
        case '\r':
            if(sb->sgetc() == '\n')
                sb->sbumpc();
            return is;
        case EOF:
            // Also handle the case when the last line has no line ending
            if(t.empty())
                is.setstate(ios::eofbit);
            return is;
        default:
            t += (char)c;
        }
    }
}

string toUpper(const string& s) {
  string res(s);
  for (char& c : res) {
    c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
  }
  return res;
}

string trim(const string& s) {
  size_t first = 0;
  size_t last = s.size();
  while (first < last && isspace(static_cast<unsigned char>(s[first]))) first++;
  while (last > first && isspace(static_cast<unsigned char>(s[last-1]))) last--;
  return s.substr(first, last-first);
}

bool parseUlong(const string& s, unsigned long& out_val) {
  if (s.empty()) return false;
  unsigned long val = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    unsigned long digit = static_cast<unsigned long>(c - '0');
    if (val > (ULONG_MAX - digit) / 10) return false; // overflow
    val = val*10 + digit;
  }
  out_val = val;
  return true;
}

string csvCell(const string& s, const char sep) {
  if (s.find_first_of(string(1, sep) + "\"\r\n") == string::npos) {
    return s;
  }
  string res = "\"";
  for (char c : s) {
    if (c == '"') res += '"';
    res += c;
  }
  res += '"';
  return res;
}

} /* namespace stringio */
