#include "material.hpp"

#include <Eigen/Core>
#include <stdexcept>

namespace ocdb {

namespace {

// Shared by all Materials that were not given a factory explicitly; stateless.
std::shared_ptr<const ProcessingStepFactory>
default_processing_step_factory() {
    static const auto factory = std::make_shared<const ProcessingStepFactory>();
    return factory;
}

double
single_value(const std::vector<double> &values) {
    if (values.size() != 1) {
        throw std::logic_error("Expected exactly one value, got " + std::to_string(values.size()));
    }
    return values.front();
}

} // namespace

Material::Material()
  : processing_step_factory_(default_processing_step_factory()) {
    n_data.axes[1].quantity = "dispersion coefficient";
    n_data.axes[1].symbol = "n";
    k_data.axes[1].quantity = "extinction coefficient";
    k_data.axes[1].symbol = "k";
}

OpticalConstants
Material::n(const ProcessingOptions &options, bool uncertainties) const {
    const auto steps = processing_step_factory_->get_processing_steps(options);
    return unpack(process(steps, n_data), uncertainties);
}

OpticalConstants
Material::k(const ProcessingOptions &options, bool uncertainties) const {
    const auto steps = processing_step_factory_->get_processing_steps(options);
    return unpack(process(steps, k_data), uncertainties);
}

ComplexIndexOfRefraction
Material::index_of_refraction(const ProcessingOptions &options, bool uncertainties) const {
    const auto steps = processing_step_factory_->get_processing_steps(options);
    Data n_processed = process(steps, n_data);
    Data k_processed = process(steps, k_data);

    if (n_processed.size() != k_processed.size()) {
        throw std::runtime_error("n and k differ in number of data points (" + std::to_string(n_processed.size()) +
                                 " vs. " + std::to_string(k_processed.size()) + ").");
    }

    const auto size = static_cast<Eigen::Index>(n_processed.size());
    Eigen::Map<const Eigen::ArrayXd> n_values(n_processed.data.data(), size);
    Eigen::Map<const Eigen::ArrayXd> k_values(k_processed.data.data(), size);
    const std::complex<double> i(0.0, 1.0);
    const Eigen::ArrayXcd n_k = n_values.cast<std::complex<double>>() - i * k_values.cast<std::complex<double>>();

    ComplexIndexOfRefraction result;
    result.axis_label = n_processed.axes[0].get_label();
    result.axis = std::move(n_processed.axes[0].values);
    result.values.assign(n_k.data(), n_k.data() + n_k.size());
    if (uncertainties) {
        result.n_lower_bounds = std::move(n_processed.lower_bounds);
        result.n_upper_bounds = std::move(n_processed.upper_bounds);
        result.k_lower_bounds = std::move(k_processed.lower_bounds);
        result.k_upper_bounds = std::move(k_processed.upper_bounds);
    }
    return result;
}

double
Material::n_at(double value, InterpolationKind interpolation, const std::string &unit) const {
    auto options = ProcessingOptions::at(value).in_unit(unit);
    options.interpolation = interpolation;
    return single_value(n(options).values);
}

double
Material::k_at(double value, InterpolationKind interpolation, const std::string &unit) const {
    auto options = ProcessingOptions::at(value).in_unit(unit);
    options.interpolation = interpolation;
    return single_value(k(options).values);
}

std::complex<double>
Material::index_of_refraction_at(double value, InterpolationKind interpolation, const std::string &unit) const {
    auto options = ProcessingOptions::at(value).in_unit(unit);
    options.interpolation = interpolation;
    const auto result = index_of_refraction(options);
    if (result.values.size() != 1) {
        throw std::logic_error("Expected exactly one value, got " + std::to_string(result.values.size()));
    }
    return result.values.front();
}

bool
Material::has_uncertainties() const {
    return n_data.has_uncertainties() && k_data.has_uncertainties();
}

void
Material::set_processing_step_factory(std::shared_ptr<const ProcessingStepFactory> factory) {
    if (!factory) { throw std::invalid_argument("Processing step factory must not be null."); }
    processing_step_factory_ = std::move(factory);
}

OpticalConstants
Material::unpack(Data data, bool uncertainties) {
    OpticalConstants result;
    result.axis_label = data.axes[0].get_label();
    result.axis = std::move(data.axes[0].values);
    result.values = std::move(data.data);
    if (uncertainties) {
        result.lower_bounds = std::move(data.lower_bounds);
        result.upper_bounds = std::move(data.upper_bounds);
    }
    return result;
}

} // namespace ocdb
