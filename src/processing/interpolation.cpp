#include "processing/interpolation.hpp"
#include "errors.hpp"

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <limits>
#include <numeric> // For std::iota
#include <sstream>
#include <stdexcept>

namespace ocdb {

namespace { // Anonymous namespace for helpers

// Indices of the axis points in ascending order of their values.
// A converted (energy) axis is descending, a wavelength axis ascending.
std::vector<std::size_t>
ascending_order(const std::vector<double> &axis) {
    std::vector<std::size_t> order(axis.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(
      order.begin(), order.end(), [&axis](std::size_t lhs, std::size_t rhs) { return axis[lhs] < axis[rhs]; });
    return order;
}

std::vector<double>
permuted(const std::vector<double> &series, const std::vector<std::size_t> &order) {
    std::vector<double> result;
    result.reserve(order.size());
    for (std::size_t index : order) { result.push_back(series[index]); }
    return result;
}

// Piecewise linear interpolation. xs must be ascending and x within [xs.front(), xs.back()].
double
interpolate_at(const std::vector<double> &xs, const std::vector<double> &ys, double x) {
    auto upper = std::upper_bound(xs.begin(), xs.end(), x);
    if (upper == xs.end()) { return ys.back(); }
    if (upper == xs.begin()) { return ys.front(); }
    const auto hi = static_cast<std::size_t>(upper - xs.begin());
    const auto lo = hi - 1;
    const double t = (x - xs[lo]) / (xs[hi] - xs[lo]);
    return ys[lo] + t * (ys[hi] - ys[lo]);
}

std::vector<double>
interpolate_series(const std::vector<double> &xs, const std::vector<double> &ys, const std::vector<double> &at) {
    std::vector<double> result;
    result.reserve(at.size());
    for (double x : at) { result.push_back(interpolate_at(xs, ys, x)); }
    return result;
}

std::vector<double>
select(const std::vector<double> &series, const std::vector<std::size_t> &indices) {
    return permuted(series, indices);
}

std::string
format_values(const std::vector<double> &values) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) { ss << ", "; }
        ss << values[i];
    }
    return ss.str();
}

} // namespace

InterpolationKind
interpolation_kind_from_string(const std::string &kind) {
    const std::string lowered = boost::algorithm::to_lower_copy(kind);
    if (lowered == "linear") { return InterpolationKind::Linear; }
    if (lowered == "none") { return InterpolationKind::None; }
    throw std::invalid_argument("Unknown interpolation kind '" + kind + "'. Supported kinds: linear, none");
}

std::string
to_string(InterpolationKind kind) {
    switch (kind) {
        case InterpolationKind::Linear: return "linear";
        case InterpolationKind::None: return "none";
    }
    return "unknown";
}

Interpolation::Interpolation(std::vector<double> values, InterpolationKind kind)
  : values_(std::move(values))
  , kind_(kind) {}

Data
Interpolation::process(Data data) const {
    check_range(data.axes[0].values);
    if (kind_ == InterpolationKind::None) { return look_up_exact(std::move(data)); }
    return interpolate_linear(std::move(data));
}

void
Interpolation::check_range(const std::vector<double> &axis) const {
    if (axis.empty()) {
        throw OutOfRange("Requested range not within data range. No data available.",
                         std::numeric_limits<double>::quiet_NaN(),
                         std::numeric_limits<double>::quiet_NaN());
    }
    const auto [min_it, max_it] = std::minmax_element(axis.begin(), axis.end());
    const double lower = *min_it;
    const double upper = *max_it;
    for (double value : values_) {
        // NaN is never in range
        if (!(value >= lower && value <= upper)) {
            std::ostringstream ss;
            ss << "Requested range not within data range. Available range: [" << lower << ", " << upper
               << "], requested: " << value;
            throw OutOfRange(ss.str(), lower, upper);
        }
    }
}

Data
Interpolation::interpolate_linear(Data data) const {
    const auto order = ascending_order(data.axes[0].values);
    const auto xs = permuted(data.axes[0].values, order);

    data.data = interpolate_series(xs, permuted(data.data, order), values_);
    if (data.has_uncertainties()) {
        data.lower_bounds = interpolate_series(xs, permuted(data.lower_bounds, order), values_);
        data.upper_bounds = interpolate_series(xs, permuted(data.upper_bounds, order), values_);
    } else {
        data.lower_bounds.clear();
        data.upper_bounds.clear();
    }
    data.axes[0].values = values_;
    return data;
}

Data
Interpolation::look_up_exact(Data data) const {
    const auto &axis = data.axes[0].values;

    std::vector<std::size_t> indices;
    std::vector<double> missing;
    for (double value : values_) {
        auto it = std::find(axis.begin(), axis.end(), value);
        if (it == axis.end()) {
            missing.push_back(value);
        } else {
            indices.push_back(static_cast<std::size_t>(it - axis.begin()));
        }
    }
    // Every stored point matching any requested value counts, so duplicates on
    // either side make the numbers differ.
    const auto matches = std::count_if(axis.begin(), axis.end(), [this](double stored) {
        return std::find(values_.begin(), values_.end(), stored) != values_.end();
    });
    if (!missing.empty()) {
        throw ValueNotAvailable("Values not available: " + format_values(missing), missing);
    }
    if (static_cast<std::size_t>(matches) != values_.size()) {
        throw ValueNotAvailable("Values not available: " + std::to_string(matches) + " matches for " +
                                  std::to_string(values_.size()) + " requested values (" +
                                  format_values(values_) + ")",
                                {});
    }

    data.data = select(data.data, indices);
    if (data.has_uncertainties()) {
        data.lower_bounds = select(data.lower_bounds, indices);
        data.upper_bounds = select(data.upper_bounds, indices);
    } else {
        data.lower_bounds.clear();
        data.upper_bounds.clear();
    }
    data.axes[0].values = values_;
    return data;
}

} // namespace ocdb
