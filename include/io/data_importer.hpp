#ifndef DATA_IMPORTER_HPP
#define DATA_IMPORTER_HPP

#include "material.hpp"

#include <string>

namespace ocdb {

/**
 * @brief Abstract base class for importers reading a Material from a data file.
 *
 * import_data() takes care of the checks common to all importers (filename
 * given, file exists, resulting data consistent); concrete importers only
 * implement read_data(). Name, symbol, metadata, references and versions are
 * left for the caller to fill in.
 *
 * Importers must hand over axes sorted ascending and free of duplicates.
 */
class DataImporter {
  public:
    explicit DataImporter(std::string data_filename = "");
    virtual ~DataImporter() = default;

    std::string data_filename; ///< Name of the file containing the numerical data.

    /**
     * @brief Import the data file into a new Material.
     *
     * @return Material with n_data and k_data populated.
     * @throws MissingInput if no filename is set.
     * @throws std::runtime_error if the file does not exist or cannot be parsed.
     * @throws std::invalid_argument if the imported data are inconsistent.
     */
    Material import_data();

  protected:
    /**
     * @brief Read data_filename into the given Material.
     */
    virtual void read_data(Material &material) = 0;
};

} // namespace ocdb

#endif // DATA_IMPORTER_HPP
