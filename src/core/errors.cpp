#include "errors.hpp"
#include "stringio.hpp"

using namespace std;

namespace errors {

ValidationError::ValidationError(const string& msg)
: runtime_error(msg), line(0), field("")
{}

ValidationError::ValidationError(const string& msg, unsigned long line, const string& field)
: runtime_error(stringio::format("line %lu, field '%s': %s", line, field.c_str(), msg.c_str())),
  line(line),
  field(field)
{}

} // namespace errors
