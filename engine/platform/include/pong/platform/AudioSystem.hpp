#pragma once

#include <SDL2/SDL_mixer.h>

#include <string>

namespace pong::platform {

class AudioSystem {
public:
    AudioSystem() = default;
    ~AudioSystem();

    AudioSystem(const AudioSystem&) = delete;
    AudioSystem& operator=(const AudioSystem&) = delete;

    bool Initialize();
    void Shutdown();

    bool initialized() const { return initialized_; }

    void PlayPaddleHit() const;
    void PlayWallBounce() const;
    void PlayScore() const;

private:
    static void FreeChunk(Mix_Chunk*& chunk);
    static void Play(Mix_Chunk* chunk);

    Mix_Chunk* LoadChunk(const std::string& filename);
    void ReleaseSubsystem();

    bool initialized_ = false;
    bool owns_subsystem_ = false;
    Mix_Chunk* paddle_ = nullptr;
    Mix_Chunk* wall_ = nullptr;
    Mix_Chunk* score_ = nullptr;
};

}  // namespace pong::platform
