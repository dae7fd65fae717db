#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Fatal error conditions raised while loading inputs, decoding alignments
 * and writing results. Expected classification outcomes (not covered,
 * ambiguous) are never reported through these.
 */
namespace errors {

/** Malformed positions-of-interest input or inconsistent allele set. */
class ValidationError : public std::runtime_error
{
public:
  /** Line number (1-based) the error refers to, 0 if not line-bound. */
  unsigned long line;
  /** Name of the offending field (may be empty). */
  std::string field;

  ValidationError(const std::string& msg);
  ValidationError(const std::string& msg, unsigned long line, const std::string& field);
};

/** Corrupt, truncated or unreadable alignment input. */
class DecodeError : public std::runtime_error
{
public:
  DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Failure while writing output. */
class IoError : public std::runtime_error
{
public:
  IoError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace errors

#endif // ERRORS_H
