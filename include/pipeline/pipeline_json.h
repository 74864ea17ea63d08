/**
 * @file pipeline_json.h
 * @brief Conversion between PipelineDescription and the engine's JSON document
 *
 * The only place that knows the engine's document keys.
 */

#pragma once

#include "pipeline/pipeline_description.h"

#include <nlohmann/json.hpp>
#include <string>

namespace camilla_remote::pipeline_json {

nlohmann::json toJson(const pipeline::PipelineDescription& description);

// Throws SchemaError on a structurally invalid document.
pipeline::PipelineDescription fromJson(const nlohmann::json& document);

std::string dump(const pipeline::PipelineDescription& description, int indent = -1);

// Throws SchemaError on malformed JSON as well as on invalid structure.
pipeline::PipelineDescription parse(const std::string& text);

}  // namespace camilla_remote::pipeline_json
