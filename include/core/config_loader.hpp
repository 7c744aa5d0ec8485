#pragma once
#include <string>
#include "core/config.hpp"

namespace tfp {

// Loads YAML at 'path', applies defaults, validates, throws on error
AppConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above for an in-memory YAML document
AppConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const AppConfig& cfg);

// Only the pipeline section. Used by Pipeline before it starts any thread
void ValidatePipelineOrThrow(const PipelineConfig& cfg);

}
