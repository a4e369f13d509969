#pragma once

#include <string>
#include <vector>

#include <fxnum/config/types.hpp>

namespace fxnum::config {

// Read configuration from file (JSON or key=value). Missing file is not an error.
// Returns list of validation errors (empty if ok).
std::vector<std::string> load_from_file(DemoConfig& cfg, const std::string& path);

// Same as load_from_file for text already in memory
std::vector<std::string> load_from_text(DemoConfig& cfg, const std::string& text);

// Apply FXNUM_* environment variables (DEMOS, SPEED_ITERATIONS, OVERFLOW_STEP, DEBUG) on top of cfg.
std::vector<std::string> apply_env_overrides(DemoConfig& cfg);

// Validate final config. Returns list of errors.
std::vector<std::string> validate_final(const DemoConfig& cfg);

} // namespace fxnum::config
