#ifndef FLTFMT_CORE_EXCEPTIONS_HPP
#define FLTFMT_CORE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace fltfmt {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &What) : std::runtime_error(What) {}
};

// Invalid format parameters. Thrown only by FormatSpec::compile.
class SchemaError : public Error {
public:
  explicit SchemaError(const std::string &What)
      : Error("format schema: " + What) {}
};

// Bytes, field values or bit text that do not fit the format.
class EncodingError : public Error {
public:
  explicit EncodingError(const std::string &What)
      : Error("encoding: " + What) {}
};

// Malformed numeral text.
class NumeralError : public Error {
public:
  explicit NumeralError(const std::string &What)
      : Error("numeral: " + What) {}
};

} // namespace fltfmt

#endif // FLTFMT_CORE_EXCEPTIONS_HPP
