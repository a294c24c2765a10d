#include "io/data_importer.hpp"
#include "errors.hpp"

#include <filesystem>
#include <stdexcept>

namespace ocdb {

DataImporter::DataImporter(std::string data_filename)
  : data_filename(std::move(data_filename)) {}

Material
DataImporter::import_data() {
    if (data_filename.empty()) { throw MissingInput("No filename for data provided", "filename"); }
    if (!std::filesystem::exists(data_filename)) { throw std::runtime_error("Could not find " + data_filename); }

    Material material;
    read_data(material);
    material.n_data.validate();
    material.k_data.validate();
    return material;
}

} // namespace ocdb
