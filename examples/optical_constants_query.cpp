#include "ocdb.hpp"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void
print_usage(const char *program) {
    std::cerr << "Usage: " << program << " <data file> [value] [unit] [interpolation]" << '\n'
              << "  data file      columns: wavelength/nm n k [n_lb n_ub k_lb k_ub]" << '\n'
              << "  value          axis value to interpolate at (omit to print all data)" << '\n'
              << "  unit           nm (default) or eV" << '\n'
              << "  interpolation  linear (default) or none for exact lookup" << '\n';
}

} // namespace

int
main(int argc, char *argv[]) {
    if (argc < 2 || argc > 5) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        // --- 1. Import the material ---
        ocdb::TxtDataImporter importer(argv[1]);
        ocdb::Material material = importer.import_data();
        material.name = argv[1];
        std::cout << "--- Optical constants from " << material.name << " ---" << '\n';
        std::cout << "Data points: " << material.n_data.size()
                  << ", uncertainties: " << (material.has_uncertainties() ? "yes" : "no") << '\n';

        // --- 2. Build the read request ---
        ocdb::ProcessingOptions options;
        if (argc > 2) { options.values = std::vector<double>{ std::stod(argv[2]) }; }
        if (argc > 3) { options.unit = argv[3]; }
        if (argc > 4) { options.interpolation = ocdb::interpolation_kind_from_string(argv[4]); }

        std::cout << "Processing steps:";
        for (const auto &step : material.processing_step_factory().get_processing_steps(options)) {
            std::cout << " [" << ocdb::step_name(step) << "]";
        }
        if (options.values) { std::cout << " (" << ocdb::to_string(options.interpolation) << ")"; }
        std::cout << '\n';

        // --- 3. Read n and k ---
        const bool uncertainties = material.has_uncertainties();
        auto const nk = material.index_of_refraction(options, uncertainties);

        std::cout << std::setprecision(8);
        if (options.scalar()) {
            std::cout << nk.axis_label << " = " << nk.axis[0] << ": n = " << nk.values[0].real()
                      << ", k = " << -nk.values[0].imag() << '\n';
            if (uncertainties) {
                std::cout << "  n in [" << nk.n_lower_bounds[0] << ", " << nk.n_upper_bounds[0] << "], k in ["
                          << nk.k_lower_bounds[0] << ", " << nk.k_upper_bounds[0] << "]" << '\n';
            }
            return EXIT_SUCCESS;
        }

        std::cout << nk.axis_label << "\tn\tk";
        if (uncertainties) { std::cout << "\tn_lb\tn_ub\tk_lb\tk_ub"; }
        std::cout << '\n';
        for (std::size_t i = 0; i < nk.values.size(); ++i) {
            std::cout << nk.axis[i] << "\t" << nk.values[i].real() << "\t" << -nk.values[i].imag();
            if (uncertainties) {
                std::cout << "\t" << nk.n_lower_bounds[i] << "\t" << nk.n_upper_bounds[i] << "\t"
                          << nk.k_lower_bounds[i] << "\t" << nk.k_upper_bounds[i];
            }
            std::cout << '\n';
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
