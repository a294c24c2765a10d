#ifndef PROCESSING_STEP_FACTORY_HPP
#define PROCESSING_STEP_FACTORY_HPP

#include "processing/processing_options.hpp"
#include "processing/processing_step.hpp"

#include <vector>

namespace ocdb {

/**
 * @brief Policy deciding which ordered sequence of processing steps a read request requires.
 *
 * Ordering: unit conversion (if a unit is requested) comes before interpolation
 * (if values are requested), so that requested values are interpreted in the
 * unit the axis is returned in. If nothing is requested, a single IdentityStep
 * is returned. The factory is stateless and may be shared between Materials.
 */
class ProcessingStepFactory {
  public:
    virtual ~ProcessingStepFactory() = default;

    /**
     * @brief Build the ordered list of steps for the given options.
     *
     * @param options Read options, validated here.
     * @return std::vector<ProcessingStep> At least one step.
     * @throws MissingInput, std::invalid_argument from ProcessingOptions::validate().
     */
    virtual std::vector<ProcessingStep> get_processing_steps(const ProcessingOptions &options) const;
};

} // namespace ocdb

#endif // PROCESSING_STEP_FACTORY_HPP
