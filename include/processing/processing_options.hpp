#ifndef PROCESSING_OPTIONS_HPP
#define PROCESSING_OPTIONS_HPP

#include "processing/interpolation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ocdb {

/**
 * @brief Options of a read request, deciding which processing steps are applied.
 *
 * Default-constructed options request the canonical data unchanged.
 *
 * Example:
 * @code
 *   auto options = ProcessingOptions::at(13.5).in_unit("eV");
 *   options.interpolation = InterpolationKind::None;
 * @endcode
 */
struct ProcessingOptions {
    /// Axis values to interpolate onto. Absent means no interpolation.
    std::optional<std::vector<double>> values;
    /// Interpolation kind used if values are given.
    InterpolationKind interpolation = InterpolationKind::Linear;
    /// Target axis unit ("nm" or "eV"). Empty means no conversion.
    std::string unit;

    static ProcessingOptions at(double value);
    static ProcessingOptions at(std::vector<double> values);

    /// Copy of these options with the target unit set.
    ProcessingOptions in_unit(std::string target_unit) const;

    /// Whether exactly one value is requested.
    bool scalar() const { return values && values->size() == 1; }

    /**
     * @brief Check the options for consistency.
     *
     * @throws MissingInput if values are present but empty.
     * @throws std::invalid_argument if a value is NaN or infinite.
     */
    void validate() const;
};

} // namespace ocdb

#endif // PROCESSING_OPTIONS_HPP
