#pragma once

#include "control/configuration_catalog.h"

#include <cstddef>
#include <filesystem>

namespace camilla_remote::app {

/**
 * @brief Write every catalog entry to <directory>/<source>-<topology>.yml.
 *
 * The content is the engine's JSON document, which the engine's YAML reader
 * accepts. The directory is created when missing.
 *
 * @return Number of files written
 * @throws std::filesystem::filesystem_error when a file cannot be created
 */
std::size_t writeCatalogFiles(const control::ConfigurationCatalog& catalog,
                              const std::filesystem::path& directory);

}  // namespace camilla_remote::app
