#ifndef METADATA_HPP
#define METADATA_HPP

#include <boost/date_time/gregorian/gregorian.hpp>
#include <string>

namespace ocdb {

/**
 * @brief Description of the uncertainty bounds stored with a dataset.
 */
struct Uncertainties {
    /// Statistical meaning of the bounds, e.g. "95%". Not used in any computation.
    std::string confidence_interval;
};

/**
 * @brief The sample the optical constants were measured on.
 *
 * Optical constants in the database are obtained from thin films measured in
 * reflection, hence the film sits on a substrate and usually a layer stack.
 */
struct Sample {
    std::string thickness;   ///< Layer thickness including unit, e.g. "40 nm".
    std::string substrate;   ///< e.g. "Si"
    std::string layer_stack; ///< e.g. "Si (C/ Co/ Ru/ Si)"
    std::string morphology;  ///< e.g. "amorphous"
};

/**
 * @brief Where and when the underlying measurement took place.
 */
struct Measurement {
    std::string type;     ///< e.g. "reflectometry"
    std::string facility; ///< e.g. "BESSY-II"
    std::string beamline; ///< e.g. "SX700"
    boost::gregorian::date date{ boost::gregorian::day_clock::local_day() };
};

/**
 * @brief Relevant metadata for the optical constants of one material.
 *
 * Owned by exactly one Material.
 */
struct Metadata {
    Uncertainties uncertainties;
    Sample sample;
    Measurement measurement;
    boost::gregorian::date date{ boost::gregorian::day_clock::local_day() }; ///< Creation date of the dataset.
    std::string comment;
};

} // namespace ocdb

#endif // METADATA_HPP
