/**
 * @file configuration_catalog.h
 * @brief Pre-validated pipeline descriptions for every menu combination
 *
 * Built once before the control surface becomes interactive. A combination the
 * engine rejects makes the whole build fail; there is no partial catalog.
 */

#pragma once

#include "control/menu_layout.h"
#include "engine/dsp_engine.h"
#include "pipeline/pipeline_synthesizer.h"

#include <map>
#include <string>
#include <utility>

namespace camilla_remote::control {

// (topology label, source label), e.g. ("2.1 DRC", "Stream")
using CatalogKey = std::pair<std::string, std::string>;

class ConfigurationCatalog {
   public:
    /**
     * @brief Synthesize and validate every (topology, source) pair of the menu.
     *
     * @throws SchemaError when a description fails the local consistency check
     *         or the engine rejects it
     * @throws EngineError when the engine cannot be reached
     */
    static ConfigurationCatalog build(const MenuLayout& menu,
                                      const pipeline::HardwareParams& hardware,
                                      engine::DspEngine& engine);

    // @throws InvariantViolation when the pair is not part of the menu
    const pipeline::PipelineDescription& lookup(const std::string& topologyLabel,
                                                const std::string& sourceLabel) const;

    bool contains(const std::string& topologyLabel, const std::string& sourceLabel) const;

    const MenuLayout& menu() const {
        return menu_;
    }
    std::size_t size() const {
        return entries_.size();
    }
    const std::map<CatalogKey, pipeline::PipelineDescription>& entries() const {
        return entries_;
    }

   private:
    ConfigurationCatalog(MenuLayout menu,
                         std::map<CatalogKey, pipeline::PipelineDescription> entries);

    MenuLayout menu_;
    std::map<CatalogKey, pipeline::PipelineDescription> entries_;
};

}  // namespace camilla_remote::control
