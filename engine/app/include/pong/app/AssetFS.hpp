#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pong::app {

bool FileExists(const std::filesystem::path& path);

// Directories searched for assets: "assets" folders above the working
// directory, $PONG_ASSETS and the executable's directory.
const std::vector<std::filesystem::path>& AssetRoots();

// First match of filename under the asset roots, or filename unchanged.
std::filesystem::path AssetPath(const std::string& filename);

}  // namespace pong::app
