#include "app/config_writer.h"

#include "control/live_control.h"
#include "logging/logger.h"
#include "pipeline/pipeline_json.h"

#include <fstream>
#include <system_error>

namespace camilla_remote::app {

std::size_t writeCatalogFiles(const control::ConfigurationCatalog& catalog,
                              const std::filesystem::path& directory) {
    std::filesystem::create_directories(directory);

    std::size_t written = 0;
    for (const auto& [key, description] : catalog.entries()) {
        const auto path = directory / control::LiveControl::configFileName(key.first, key.second);
        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::filesystem::filesystem_error(
                "Cannot open config file for writing", path,
                std::make_error_code(std::errc::permission_denied));
        }
        out << pipeline_json::dump(description, 2) << '\n';
        LOG_INFO("Wrote {}", path.string());
        ++written;
    }
    return written;
}

}  // namespace camilla_remote::app
