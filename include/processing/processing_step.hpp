#ifndef PROCESSING_STEP_HPP
#define PROCESSING_STEP_HPP

#include "data.hpp"
#include "processing/interpolation.hpp"
#include "processing/unit_conversion.hpp"

#include <string>
#include <variant>
#include <vector>

namespace ocdb {

/**
 * @brief Processing step returning its input unchanged.
 *
 * Used whenever a read requests no transformation, so that callers can always
 * apply at least one step.
 */
struct IdentityStep {
    Data process(Data data) const { return data; }
};

/**
 * @brief One unit of transformation over a Data record.
 *
 * The set of step kinds is closed; which steps are applied, and in which
 * order, is decided by ProcessingStepFactory.
 */
using ProcessingStep = std::variant<IdentityStep, UnitConversion, Interpolation>;

/**
 * @brief Apply a single processing step.
 */
Data
process(const ProcessingStep &step, Data data);

/**
 * @brief Apply processing steps in order, feeding each output into the next step.
 *
 * The first exception thrown by a step aborts the remaining steps.
 */
Data
process(const std::vector<ProcessingStep> &steps, Data data);

/**
 * @brief Name of the step kind: "identity", "unit conversion" or "interpolation".
 */
std::string
step_name(const ProcessingStep &step);

} // namespace ocdb

#endif // PROCESSING_STEP_HPP
