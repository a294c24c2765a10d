#include "processing/unit_conversion.hpp"
#include "errors.hpp"
#include "physical_constants.hpp"

#include <Eigen/Core>
#include <boost/algorithm/string/predicate.hpp>

namespace ocdb {

namespace {

const std::string nanometre = "nm";
const std::string electronvolt = "eV";

// Relabel an axis for the given (canonical) unit.
void
set_axis_unit(Axis &axis, const std::string &unit) {
    axis.unit = unit;
    if (unit == nanometre) {
        axis.quantity = "wavelength";
        axis.symbol = "\\lambda";
    } else {
        axis.quantity = "energy";
        axis.symbol = "E";
    }
}

const std::string &
canonical_unit(const std::string &unit) {
    if (boost::algorithm::iequals(unit, nanometre)) { return nanometre; }
    if (boost::algorithm::iequals(unit, electronvolt)) { return electronvolt; }
    throw UnsupportedUnit(unit);
}

} // namespace

bool
is_supported_unit(const std::string &unit) {
    return boost::algorithm::iequals(unit, nanometre) || boost::algorithm::iequals(unit, electronvolt);
}

UnitConversion::UnitConversion(std::string unit)
  : unit_(std::move(unit)) {}

Data
UnitConversion::process(Data data) const {
    if (unit_.empty()) { return data; }
    const std::string &target = canonical_unit(unit_);
    Axis &axis = data.axes[0];
    if (boost::algorithm::iequals(target, axis.unit)) { return data; }

    if (!is_supported_unit(axis.unit)) { throw UnsupportedUnit(axis.unit); }

    // nm -> eV and eV -> nm use the same relation
    Eigen::Map<Eigen::ArrayXd> values(axis.values.data(), static_cast<Eigen::Index>(axis.values.size()));
    values = constants::nm_ev_factor / values;

    set_axis_unit(axis, target);
    return data;
}

} // namespace ocdb
