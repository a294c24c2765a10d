#include "processing/processing_step_factory.hpp"

namespace ocdb {

std::vector<ProcessingStep>
ProcessingStepFactory::get_processing_steps(const ProcessingOptions &options) const {
    options.validate();

    std::vector<ProcessingStep> steps;
    // Convert first: requested values refer to the unit the axis is returned in.
    if (!options.unit.empty()) { steps.emplace_back(UnitConversion(options.unit)); }
    if (options.values) { steps.emplace_back(Interpolation(*options.values, options.interpolation)); }
    if (steps.empty()) { steps.emplace_back(IdentityStep{}); }
    return steps;
}

} // namespace ocdb
