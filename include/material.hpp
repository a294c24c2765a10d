#ifndef MATERIAL_HPP
#define MATERIAL_HPP

#include "data.hpp"
#include "metadata.hpp"
#include "processing/processing_options.hpp"
#include "processing/processing_step_factory.hpp"
#include "reference.hpp"

#include <complex>
#include <memory>
#include <string>
#include <vector>

namespace ocdb {

struct Version;

/**
 * @brief Result of reading n or k: axis values and the requested quantity.
 *
 * lower_bounds and upper_bounds are only filled if uncertainties were requested
 * (and are present in the data).
 */
struct OpticalConstants {
    std::string axis_label; ///< Label of the processed axis, e.g. "$E$ / eV".
    std::vector<double> axis;
    std::vector<double> values;
    std::vector<double> lower_bounds;
    std::vector<double> upper_bounds;
};

/**
 * @brief Result of reading the complex index of refraction.
 *
 * values holds n - i·k. Bounds of n and k are kept separate and only filled
 * if uncertainties were requested.
 */
struct ComplexIndexOfRefraction {
    std::string axis_label;
    std::vector<double> axis;
    std::vector<std::complex<double>> values;
    std::vector<double> n_lower_bounds;
    std::vector<double> n_upper_bounds;
    std::vector<double> k_lower_bounds;
    std::vector<double> k_upper_bounds;
};

/**
 * @brief Optical constants and relevant metadata for a single material.
 *
 * Data and metadata form one unit, the latter including bibliographic records
 * for proper citation. n_data and k_data are the canonical datasets; reads
 * never modify them but process private copies through the steps the bound
 * ProcessingStepFactory selects.
 *
 * Sign convention: the complex index of refraction is n - i·k.
 *
 * Example:
 * @code
 *   auto n = material.n();                                    // canonical data
 *   auto k = material.k(ProcessingOptions::at(13.5));          // interpolated
 *   auto nk = material.index_of_refraction(ProcessingOptions().in_unit("eV"), true);
 *   double n_13_5 = material.n_at(13.5);
 * @endcode
 */
class Material {
  public:
    Material();

    std::string name;   ///< Human-readable (English common) name.
    std::string symbol; ///< Unique key within a Collection, e.g. element symbol or molecular formula.
    std::vector<Reference> references; ///< Bibliographic records in citation order.
    Metadata metadata;
    std::vector<Version> versions; ///< Alternate or superseded datasets of this material.
    Data n_data;                   ///< Dispersion coefficient n.
    Data k_data;                   ///< Extinction coefficient k.

    /**
     * @brief Real part n of the index of refraction.
     *
     * @param options       Values to interpolate onto, interpolation kind and target unit.
     * @param uncertainties Whether to return lower and upper bounds as well.
     * @throws OutOfRange, ValueNotAvailable, UnsupportedUnit, MissingInput from processing.
     */
    OpticalConstants n(const ProcessingOptions &options = {}, bool uncertainties = false) const;

    /**
     * @brief Imaginary part k of the index of refraction. See n().
     */
    OpticalConstants k(const ProcessingOptions &options = {}, bool uncertainties = false) const;

    /**
     * @brief Complex index of refraction n - i·k.
     *
     * The same steps are applied independently to copies of n_data and k_data.
     */
    ComplexIndexOfRefraction index_of_refraction(const ProcessingOptions &options = {},
                                                 bool uncertainties = false) const;

    /// n at a single axis value.
    double n_at(double value,
                InterpolationKind interpolation = InterpolationKind::Linear,
                const std::string &unit = "") const;
    /// k at a single axis value.
    double k_at(double value,
                InterpolationKind interpolation = InterpolationKind::Linear,
                const std::string &unit = "") const;
    /// n - i·k at a single axis value.
    std::complex<double> index_of_refraction_at(double value,
                                                InterpolationKind interpolation = InterpolationKind::Linear,
                                                const std::string &unit = "") const;

    /**
     * @brief True only if both n_data and k_data carry uncertainty bounds.
     */
    bool has_uncertainties() const;

    const ProcessingStepFactory &processing_step_factory() const { return *processing_step_factory_; }

    /**
     * @brief Bind another processing step factory.
     * @throws std::invalid_argument if factory is null.
     */
    void set_processing_step_factory(std::shared_ptr<const ProcessingStepFactory> factory);

  private:
    std::shared_ptr<const ProcessingStepFactory> processing_step_factory_;

    static OpticalConstants unpack(Data data, bool uncertainties);
};

/**
 * @brief Alternate dataset of a Material, e.g. an older measurement superseded by the current one.
 */
struct Version {
    Material material;       ///< The alternate dataset, fully formed.
    std::string description; ///< What distinguishes this version, not merely that it is older.
    bool current = false;
};

} // namespace ocdb

#endif // MATERIAL_HPP
