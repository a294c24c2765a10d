#include "data.hpp"

#include <stdexcept>
#include <string>

namespace ocdb {

void
Data::validate() const {
    if (axes[0].values.size() != data.size()) {
        throw std::invalid_argument("Number of axis values (" + std::to_string(axes[0].values.size()) +
                                    ") must match number of data points (" + std::to_string(data.size()) + ").");
    }
    if (!axes[1].values.empty()) {
        throw std::invalid_argument("Dependent axis must not carry values.");
    }
    if (lower_bounds.empty() != upper_bounds.empty()) {
        throw std::invalid_argument("Lower and upper bounds must be given together.");
    }
    if (has_uncertainties() && (lower_bounds.size() != data.size() || upper_bounds.size() != data.size())) {
        throw std::invalid_argument("Uncertainty bounds (" + std::to_string(lower_bounds.size()) + ", " +
                                    std::to_string(upper_bounds.size()) + ") must match number of data points (" +
                                    std::to_string(data.size()) + ").");
    }
}

} // namespace ocdb
