#include "control/configuration_catalog.h"

#include "core/error_codes.h"
#include "logging/logger.h"

namespace camilla_remote::control {

ConfigurationCatalog::ConfigurationCatalog(
    MenuLayout menu, std::map<CatalogKey, pipeline::PipelineDescription> entries)
    : menu_(std::move(menu)), entries_(std::move(entries)) {}

ConfigurationCatalog ConfigurationCatalog::build(const MenuLayout& menu,
                                                 const pipeline::HardwareParams& hardware,
                                                 engine::DspEngine& engine) {
    const std::string menuProblem = validateMenuLayout(menu);
    if (!menuProblem.empty()) {
        throw InvariantViolation("Catalog: unusable menu: " + menuProblem);
    }

    std::map<CatalogKey, pipeline::PipelineDescription> entries;
    for (const auto& topology : menu.topologies) {
        for (const auto& source : menu.sources) {
            pipeline::SynthesisRequest request;
            request.topology = topology.topology;
            request.correction = topology.correction;
            request.inputSource = source.source;
            request.sourceLabel = source.label;

            auto description = pipeline::synthesize(request, hardware);

            auto problems = pipeline::findConsistencyProblems(description);
            if (!problems.empty()) {
                LOG_ERROR("Catalog: '{}' / '{}' is inconsistent: {}", topology.label,
                          source.label, problems.front());
                throw SchemaError("Description for '" + topology.label + "' / '" +
                                      source.label + "' is inconsistent: " + problems.front(),
                                  ErrorCode::SCHEMA_INVALID_CONFIG);
            }

            try {
                engine.validate(description);
            } catch (const SchemaError& e) {
                LOG_ERROR("Catalog: engine rejected '{}' / '{}': {}", topology.label,
                          source.label, e.what());
                throw;
            }

            LOG_INFO("Catalog: validated '{}' / '{}' (mixer {})", topology.label, source.label,
                     pipeline::mixerNameFor(request));
            entries.emplace(CatalogKey{topology.label, source.label}, std::move(description));
        }
    }

    return ConfigurationCatalog(menu, std::move(entries));
}

const pipeline::PipelineDescription& ConfigurationCatalog::lookup(
    const std::string& topologyLabel, const std::string& sourceLabel) const {
    auto it = entries_.find(CatalogKey{topologyLabel, sourceLabel});
    if (it == entries_.end()) {
        throw InvariantViolation("Catalog has no entry for '" + topologyLabel + "' / '" +
                                 sourceLabel + "'");
    }
    return it->second;
}

bool ConfigurationCatalog::contains(const std::string& topologyLabel,
                                    const std::string& sourceLabel) const {
    return entries_.count(CatalogKey{topologyLabel, sourceLabel}) > 0;
}

}  // namespace camilla_remote::control
