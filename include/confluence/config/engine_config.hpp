#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Engine Configuration
// ============================================================================
// YAML-backed settings: logging, execution and every analysis threshold
// Missing keys keep their defaults
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/utils/logger.hpp"

#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace confluence::config {

struct EngineConfig {
    utils::LogConfig logging;
    AnalysisThresholds thresholds;
    bool parallel_timeframes = false;
};

/// Overlay the values present in a parsed document onto config
void apply_yaml(const YAML::Node& root, EngineConfig& config);

/// Parse a YAML document from text; throws YAML::Exception on syntax errors
[[nodiscard]] EngineConfig parse_engine_config(const std::string& yaml_text);

/// Load from file. An unreadable or unparsable file is logged and defaults are used.
/// Throws std::invalid_argument when the resulting thresholds are invalid.
[[nodiscard]] EngineConfig load_engine_config(const std::string& path);

}  // namespace confluence::config
