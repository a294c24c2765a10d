#ifndef TXT_DATA_IMPORTER_HPP
#define TXT_DATA_IMPORTER_HPP

#include "io/data_importer.hpp"

namespace ocdb {

/**
 * @brief Importer for plain-text files with whitespace-separated columns.
 *
 * Columns: wavelength/nm, n, k, and optionally n_lb, n_ub, k_lb, k_ub
 * (lower and upper bounds of n and k). Lines starting with '#' and blank
 * lines are skipped. Rows are sorted by ascending wavelength.
 */
class TxtDataImporter : public DataImporter {
  public:
    using DataImporter::DataImporter;

  protected:
    /**
     * @throws std::runtime_error on rows with other than 3 or 7 columns, non-numeric
     *         or non-finite entries, non-positive wavelengths, inconsistent column
     *         counts or duplicate wavelengths.
     */
    void read_data(Material &material) override;
};

} // namespace ocdb

#endif // TXT_DATA_IMPORTER_HPP
