#pragma once

#include <string>

#include "pong/core/Ball.hpp"
#include "pong/core/Control.hpp"
#include "pong/core/Json.hpp"

namespace pong::core {

struct GameConfig {
    int arena_width = 800;
    int arena_height = 500;
    int fps = 30;

    int ball_size = 20;
    int ball_speed_x = 5;
    int ball_speed_y = 5;

    int paddle_width = 10;
    int paddle_height = 80;
    int player_max_speed = 10;
    int computer_max_speed = 10;
    int key_step = 7;

    ControlScheme control = ControlScheme::AcceleratingKeyHold;
    ServeFlip serve_flip = ServeFlip::Vertical;
    std::string title = "Ping Pong";

    // Throws std::invalid_argument when a value would break gameplay.
    void Validate() const;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

const char* ControlSchemeName(ControlScheme scheme) noexcept;
ControlScheme ParseControlScheme(const std::string& name);

const char* ServeFlipName(ServeFlip flip) noexcept;
ServeFlip ParseServeFlip(const std::string& name);

}  // namespace pong::core
