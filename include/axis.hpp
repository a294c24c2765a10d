#ifndef AXIS_HPP
#define AXIS_HPP

#include <string>
#include <vector>

namespace ocdb {

/**
 * @brief One labelled numeric coordinate of a dataset.
 *
 * The independent axis of a Data record carries the values (wavelengths or
 * photon energies); the dependent axis only carries quantity, symbol and unit.
 */
struct Axis {
    std::vector<double> values; ///< Coordinate values, empty for a label-only axis.
    std::string quantity;       ///< Human-readable quantity, e.g. "wavelength".
    std::string symbol;         ///< Symbol in LaTeX notation, e.g. "\lambda".
    std::string unit;           ///< Unit, e.g. "nm". Empty for dimensionless quantities.

    /**
     * @brief Label suitable for an axis of a plot.
     *
     * The symbol (wrapped in math delimiters) is preferred over the quantity.
     * If a unit is set, it is appended as " / unit".
     *
     * @return std::string e.g. "$\lambda$ / nm", "$n$" or "wavelength / nm".
     */
    std::string get_label() const;
};

} // namespace ocdb

#endif // AXIS_HPP
