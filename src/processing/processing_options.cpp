#include "processing/processing_options.hpp"
#include "errors.hpp"

#include <cmath>
#include <stdexcept>

namespace ocdb {

ProcessingOptions
ProcessingOptions::at(double value) {
    return at(std::vector<double>{ value });
}

ProcessingOptions
ProcessingOptions::at(std::vector<double> values) {
    ProcessingOptions options;
    options.values = std::move(values);
    return options;
}

ProcessingOptions
ProcessingOptions::in_unit(std::string target_unit) const {
    ProcessingOptions options = *this;
    options.unit = std::move(target_unit);
    return options;
}

void
ProcessingOptions::validate() const {
    if (!values) { return; }
    if (values->empty()) { throw MissingInput("No values provided to interpolate onto", "values"); }
    for (double value : *values) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Requested values must be finite, got " + std::to_string(value));
        }
    }
}

} // namespace ocdb
