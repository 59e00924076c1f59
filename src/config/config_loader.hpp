#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace runbox::config {

// Reads $RUNBOX_CONFIG (or ~/.runbox/config.json) and applies RUNBOX_* overrides.
Config LoadConfig();

// Same as LoadConfig but from an explicit file; a missing file keeps defaults.
Config LoadConfigFrom(const std::filesystem::path& path);

}  // namespace runbox::config
