#pragma once

#include <filesystem>

#include "pong/core/GameConfig.hpp"

namespace pong::app {

inline constexpr const char* kConfigFileName = "pong.json";

// Reads a config file. A missing or unparsable file yields the defaults;
// unknown enum names and invalid values throw std::invalid_argument.
pong::core::GameConfig LoadGameConfig(const std::filesystem::path& path);

// Looks for pong.json in the asset roots.
pong::core::GameConfig LoadGameConfig();

}  // namespace pong::app
