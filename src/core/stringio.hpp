#ifndef STRINGIO_H
#define STRINGIO_H

#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace stringio {

/** String formatting. */
template<typename ... Args>
std::string format(const std::string& format, Args ... args);
/** Splits a string by a delimiter into an existing vector */
std::vector<std::string> &split(const std::string&, char, std::vector<std::string>&);
/** Splits a string by a delimiter into a new vector */
std::vector<std::string> split(const std::string&, char);
/** Joins strings using a separator. */
std::string join(const std::vector<std::string>& elems, const std::string& sep);
/** Reads a line from a stream, dealing with different styles of line endings. */
std::istream& safeGetline(std::istream& is, std::string& t);
/** Returns an upper-case copy of a string (ASCII only). */
std::string toUpper(const std::string& s);
/** Removes leading and trailing whitespace. */
std::string trim(const std::string& s);
/** Parse a non-negative integer; false if the string is not a plain decimal number. */
bool parseUlong(const std::string& s, unsigned long& out_val);
/** Quote a CSV cell if it contains separators, quotes or line breaks. */
std::string csvCell(const std::string& s, const char sep=',');

/* Templated function definitions. */

template<typename ... Args>
std::string format( const std::string& format, Args ... args )
{
  size_t size = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
  std::unique_ptr<char[]> buf( new char[ size ] );
  std::snprintf( buf.get(), size, format.c_str(), args ... );
  return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

} /* namespace stringio */

#endif /*STRINGIO_H */
