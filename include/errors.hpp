#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ocdb {

/**
 * @brief Common base of all errors raised by the read pipeline and its collaborators.
 *
 * Callers that do not care about the exact reason can catch this one type.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief A requested axis value lies outside the stored domain (extrapolation).
 */
class OutOfRange : public Error {
  public:
    OutOfRange(const std::string &message, double lower, double upper)
      : Error(message)
      , lower_(lower)
      , upper_(upper) {}

    /// Smallest axis value available in the data.
    double lower() const { return lower_; }
    /// Largest axis value available in the data.
    double upper() const { return upper_; }

  private:
    double lower_;
    double upper_;
};

/**
 * @brief Exact lookup requested, but not every value maps onto exactly one stored axis value.
 */
class ValueNotAvailable : public Error {
  public:
    ValueNotAvailable(const std::string &message, std::vector<double> values)
      : Error(message)
      , values_(std::move(values)) {}

    /// Requested values without an exact match (may be empty for ambiguous matches).
    const std::vector<double> &values() const { return values_; }

  private:
    std::vector<double> values_;
};

/**
 * @brief Unit conversion requested to or from a unit other than "nm" and "eV".
 */
class UnsupportedUnit : public Error {
  public:
    explicit UnsupportedUnit(const std::string &unit)
      : Error("Unsupported unit '" + unit + "'. Supported units: nm, eV")
      , unit_(unit) {}

    const std::string &unit() const { return unit_; }

  private:
    std::string unit_;
};

/**
 * @brief A required input (filename, symbol, list of values, ...) was not supplied.
 */
class MissingInput : public Error {
  public:
    MissingInput(const std::string &message, std::string input)
      : Error(message)
      , input_(std::move(input)) {}

    /// Name of the missing input, e.g. "filename" or "symbol".
    const std::string &input() const { return input_; }

  private:
    std::string input_;
};

/**
 * @brief A Collection configured to reject duplicates was given a second Material with the same symbol.
 */
class DuplicateSymbol : public Error {
  public:
    explicit DuplicateSymbol(const std::string &symbol)
      : Error("Material with symbol '" + symbol + "' already in collection")
      , symbol_(symbol) {}

    const std::string &symbol() const { return symbol_; }

  private:
    std::string symbol_;
};

} // namespace ocdb

#endif // ERRORS_HPP
