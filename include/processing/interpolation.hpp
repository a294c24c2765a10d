#ifndef INTERPOLATION_HPP
#define INTERPOLATION_HPP

#include "data.hpp"

#include <string>
#include <vector>

namespace ocdb {

/**
 * @brief How values between stored axis points are obtained.
 */
enum class InterpolationKind {
    Linear, ///< Piecewise linear interpolation between neighbouring points.
    None    ///< No interpolation: requested values must be present verbatim in the axis.
};

/**
 * @brief Parse an interpolation kind ("linear" or "none", case-insensitive).
 * @throws std::invalid_argument for any other identifier.
 */
InterpolationKind
interpolation_kind_from_string(const std::string &kind);

std::string
to_string(InterpolationKind kind);

/**
 * @brief Processing step resampling a Data record onto requested axis values.
 *
 * This is the only step changing the length of the series in a Data record.
 * Afterwards axes[0].values equals the requested values, and data (and the
 * bounds, if present) are of the same length. Extrapolation is never performed.
 */
class Interpolation {
  public:
    /**
     * @brief Construct an interpolation step.
     *
     * @param values Axis values to resample onto. A scalar request is a single-element vector.
     * @param kind   Linear interpolation (default) or exact lookup.
     */
    explicit Interpolation(std::vector<double> values, InterpolationKind kind = InterpolationKind::Linear);

    /**
     * @brief Resample the given data.
     *
     * @param data Data record to process (consumed, usually a private copy).
     * @return Data The resampled record.
     * @throws OutOfRange if a requested value lies outside [min, max] of axes[0].values.
     * @throws ValueNotAvailable for exact lookup if a value has no exact match or matches are ambiguous.
     */
    Data process(Data data) const;

    const std::vector<double> &values() const { return values_; }
    InterpolationKind kind() const { return kind_; }

  private:
    std::vector<double> values_;
    InterpolationKind kind_;

    void check_range(const std::vector<double> &axis) const;
    Data interpolate_linear(Data data) const;
    Data look_up_exact(Data data) const;
};

} // namespace ocdb

#endif // INTERPOLATION_HPP
