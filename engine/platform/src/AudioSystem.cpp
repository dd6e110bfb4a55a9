#include "pong/platform/AudioSystem.hpp"

#include <SDL2/SDL.h>

#include <filesystem>

#include "pong/app/AssetFS.hpp"

namespace pong::platform {

AudioSystem::~AudioSystem() {
    Shutdown();
}

bool AudioSystem::Initialize() {
    if (initialized_) {
        return true;
    }
    if (SDL_WasInit(SDL_INIT_AUDIO) == 0) {
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "SDL audio unavailable: %s", SDL_GetError());
            return false;
        }
        owns_subsystem_ = true;
    }
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        ReleaseSubsystem();
        return false;
    }
    Mix_AllocateChannels(8);
    Mix_Volume(-1, static_cast<int>(MIX_MAX_VOLUME * 0.8f));

    paddle_ = LoadChunk("sounds/paddle.wav");
    wall_ = LoadChunk("sounds/wall.wav");
    score_ = LoadChunk("sounds/score.wav");

    initialized_ = true;
    return true;
}

void AudioSystem::Shutdown() {
    if (!initialized_) {
        return;
    }
    Mix_HaltChannel(-1);
    FreeChunk(paddle_);
    FreeChunk(wall_);
    FreeChunk(score_);
    Mix_CloseAudio();
    ReleaseSubsystem();
    initialized_ = false;
}

void AudioSystem::ReleaseSubsystem() {
    if (owns_subsystem_) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        owns_subsystem_ = false;
    }
}

void AudioSystem::PlayPaddleHit() const {
    Play(paddle_);
}

void AudioSystem::PlayWallBounce() const {
    Play(wall_);
}

void AudioSystem::PlayScore() const {
    Play(score_);
}

void AudioSystem::FreeChunk(Mix_Chunk*& chunk) {
    if (chunk) {
        Mix_FreeChunk(chunk);
        chunk = nullptr;
    }
}

void AudioSystem::Play(Mix_Chunk* chunk) {
    if (!chunk) {
        return;
    }
    Mix_PlayChannel(-1, chunk, 0);
}

Mix_Chunk* AudioSystem::LoadChunk(const std::string& filename) {
    std::filesystem::path path = pong::app::AssetPath(filename);
    if (!pong::app::FileExists(path)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Sound %s not found, playing without it",
                    filename.c_str());
        return nullptr;
    }
    Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str());
    if (!chunk) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to load %s: %s", path.string().c_str(),
                    Mix_GetError());
    }
    return chunk;
}

}  // namespace pong::platform
