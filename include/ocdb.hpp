#ifndef OCDB_HPP
#define OCDB_HPP

// Include all library headers here
#include "axis.hpp"
#include "collection.hpp"
#include "data.hpp"
#include "errors.hpp"
#include "io/txt_data_importer.hpp"
#include "material.hpp"
#include "metadata.hpp"
#include "physical_constants.hpp"
#include "processing/processing_options.hpp"
#include "processing/processing_step.hpp"
#include "processing/processing_step_factory.hpp"
#include "reference.hpp"

// This is the main header file for the ocdb library
// Include this single header to access all functionality

#endif // OCDB_HPP
