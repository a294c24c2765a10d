#include "axis.hpp"

namespace ocdb {

std::string
Axis::get_label() const {
    std::string measure = symbol.empty() ? quantity : "$" + symbol + "$";
    if (unit.empty()) { return measure; }
    return measure + " / " + unit;
}

} // namespace ocdb
