#pragma once

#include "pipeline/pipeline_description.h"

#include <string>

namespace camilla_remote::engine {

/**
 * @brief Narrow interface to a running DSP engine instance.
 *
 * Transport failures throw EngineError; validate() throws SchemaError when the
 * engine rejects a description. Implementations never retry.
 */
class DspEngine {
   public:
    virtual ~DspEngine() = default;

    virtual void validate(const pipeline::PipelineDescription& description) = 0;

    // Replace the entire live pipeline atomically
    virtual void setLiveConfig(const pipeline::PipelineDescription& description) = 0;
    virtual pipeline::PipelineDescription getLiveConfig() = 0;

    virtual double getVolume() = 0;
    virtual void setVolume(double volumeDb) = 0;

    virtual bool getMute() = 0;
    virtual void setMute(bool muted) = 0;

    // File-path loading: point the engine at a config file, then re-apply it
    virtual void setConfigName(const std::string& path) = 0;
    virtual void reload() = 0;
};

}  // namespace camilla_remote::engine
