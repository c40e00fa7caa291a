#pragma once
// Single Responsibility: Configuration file parsing

#include "Config.hpp"
#include <string>

namespace clipring {

// Load config from ~/.config/clipring/clipring.toml
Config loadConfig();

// Parse from an explicit path (missing file -> defaults)
Config loadConfigFrom(const std::string& path);

// Parse already-read file contents on top of the defaults
Config parseConfig(const std::string& contents);

// Save config to config.configPath
bool saveConfig(const Config& config);

// Get config file path
std::string getConfigPath();

// Get data directory path
std::string getDataDir();

// clipring.history beside the executable, or in the data dir if that fails
std::string getDefaultHistoryPath();

} // namespace clipring
