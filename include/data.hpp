#ifndef DATA_HPP
#define DATA_HPP

#include "axis.hpp"

#include <array>
#include <vector>

namespace ocdb {

/**
 * @brief Unit containing one numeric series together with its two axes.
 *
 * axes[0] holds the independent variable (wavelength or energy) and its values,
 * axes[1] only describes the dependent variable stored in `data`.
 * Lower and upper bounds are either both empty or both as long as `data`.
 *
 * Data has value semantics: copying a Data record copies all series.
 */
struct Data {
    std::vector<double> data;         ///< Dependent variable, parallel to axes[0].values.
    std::array<Axis, 2> axes;         ///< Independent axis (with values) and dependent axis (label only).
    std::vector<double> lower_bounds; ///< Lower uncertainty bounds, parallel to data (or empty).
    std::vector<double> upper_bounds; ///< Upper uncertainty bounds, parallel to data (or empty).

    /**
     * @brief Whether both uncertainty bounds are present.
     */
    bool has_uncertainties() const { return !lower_bounds.empty() && !upper_bounds.empty(); }

    /**
     * @brief Number of data points.
     */
    std::size_t size() const { return data.size(); }

    /**
     * @brief Check the length invariants between the parallel series.
     *
     * @throws std::invalid_argument if axes[0].values and data differ in length,
     *         if the bounds are neither empty nor as long as data, or if axes[1]
     *         carries values.
     */
    void validate() const;
};

} // namespace ocdb

#endif // DATA_HPP
