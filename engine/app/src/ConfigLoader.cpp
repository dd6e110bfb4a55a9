#include "pong/app/ConfigLoader.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>

#include "pong/app/AssetFS.hpp"

namespace pong::app {

pong::core::GameConfig LoadGameConfig(const std::filesystem::path& path) {
    if (!FileExists(path)) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "No %s found, using defaults",
                    path.string().c_str());
        return pong::core::GameConfig{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot open %s, using defaults",
                    path.string().c_str());
        return pong::core::GameConfig{};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    pong::core::GameConfig config;
    try {
        config = pong::core::GameConfig::Deserialize(buffer.str());
    } catch (const pong::core::Json::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring malformed %s: %s",
                    path.string().c_str(), ex.what());
        return pong::core::GameConfig{};
    }
    config.Validate();
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Loaded config from %s", path.string().c_str());
    return config;
}

pong::core::GameConfig LoadGameConfig() {
    return LoadGameConfig(AssetPath(kConfigFileName));
}

}  // namespace pong::app
