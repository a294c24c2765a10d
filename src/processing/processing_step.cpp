#include "processing/processing_step.hpp"

#include <type_traits>

namespace ocdb {

Data
process(const ProcessingStep &step, Data data) {
    return std::visit([&data](const auto &concrete_step) { return concrete_step.process(std::move(data)); }, step);
}

Data
process(const std::vector<ProcessingStep> &steps, Data data) {
    for (const auto &step : steps) { data = process(step, std::move(data)); }
    return data;
}

std::string
step_name(const ProcessingStep &step) {
    return std::visit(
      [](const auto &concrete_step) -> std::string {
          using T = std::decay_t<decltype(concrete_step)>;
          if constexpr (std::is_same_v<T, UnitConversion>) {
              return "unit conversion";
          } else if constexpr (std::is_same_v<T, Interpolation>) {
              return "interpolation";
          } else {
              return "identity";
          }
      },
      step);
}

} // namespace ocdb
