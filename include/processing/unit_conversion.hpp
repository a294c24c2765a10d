#ifndef UNIT_CONVERSION_HPP
#define UNIT_CONVERSION_HPP

#include "data.hpp"

#include <string>

namespace ocdb {

/**
 * @brief Processing step converting the independent axis between nanometres and electronvolts.
 *
 * Uses E[eV] = h·c/e · 1e9 / λ[nm], which is its own inverse. Only axes[0] is
 * touched: values are remapped and quantity, symbol and unit relabelled. The
 * order of the points is kept, hence an ascending wavelength axis becomes a
 * descending energy axis. data and the uncertainty bounds are never changed.
 */
class UnitConversion {
  public:
    /**
     * @param unit Target unit, "nm" or "eV" (case-insensitive). Empty means no conversion.
     */
    explicit UnitConversion(std::string unit = "");

    /**
     * @brief Convert axes[0] of the given data to the target unit.
     *
     * No-op if the target unit is empty or equals the current unit (case-insensitively).
     *
     * @throws UnsupportedUnit if the target or the current unit is neither "nm" nor "eV".
     */
    Data process(Data data) const;

    const std::string &unit() const { return unit_; }

  private:
    std::string unit_;
};

/**
 * @brief Whether the unit is one of the supported axis units ("nm", "eV"), case-insensitively.
 */
bool
is_supported_unit(const std::string &unit);

} // namespace ocdb

#endif // UNIT_CONVERSION_HPP
