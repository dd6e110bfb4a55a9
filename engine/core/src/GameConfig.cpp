#include "pong/core/GameConfig.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace pong::core {

namespace {

void ReadInt(const Json& json, const char* key, int& out) {
    if (!json.contains(key) || !json[key].is_number_integer()) {
        return;
    }
    const auto& value = json[key];
    const bool in_range =
        value.is_number_unsigned()
            ? value.get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::invalid_argument(std::string("Value out of range: ") + key);
    }
    out = value.get<int>();
}

bool SpeedWithin(int speed, int limit) {
    return speed >= -limit && speed <= limit;
}

void Require(bool condition, const char* message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

}  // namespace

const char* ControlSchemeName(ControlScheme scheme) noexcept {
    switch (scheme) {
        case ControlScheme::TargetFollow:
            return "pointer";
        case ControlScheme::AcceleratingKeyHold:
            return "keys";
    }
    return "keys";
}

ControlScheme ParseControlScheme(const std::string& name) {
    if (name == "pointer") {
        return ControlScheme::TargetFollow;
    }
    if (name == "keys") {
        return ControlScheme::AcceleratingKeyHold;
    }
    throw std::invalid_argument("Unknown control scheme: " + name);
}

const char* ServeFlipName(ServeFlip flip) noexcept {
    switch (flip) {
        case ServeFlip::Vertical:
            return "vertical";
        case ServeFlip::Horizontal:
            return "horizontal";
    }
    return "vertical";
}

ServeFlip ParseServeFlip(const std::string& name) {
    if (name == "vertical") {
        return ServeFlip::Vertical;
    }
    if (name == "horizontal") {
        return ServeFlip::Horizontal;
    }
    throw std::invalid_argument("Unknown serve flip: " + name);
}

void GameConfig::Validate() const {
    Require(arena_width > 0 && arena_height > 0, "arena size must be positive");
    Require(fps > 0, "fps must be positive");
    Require(ball_size > 0, "ball size must be positive");
    Require(ball_size < arena_width && ball_size < arena_height, "ball must fit in the arena");
    Require(paddle_width > 0 && paddle_height > 0, "paddle size must be positive");
    Require(paddle_height <= arena_height, "paddle must fit in the arena");
    Require(paddle_width < arena_width - paddle_width, "paddles must fit in the arena");
    Require(player_max_speed >= 0 && computer_max_speed >= 0, "paddle speed must not be negative");
    Require(key_step > 0, "key step must be positive");
    // A faster ball could pass through a paddle between two ticks.
    Require(SpeedWithin(ball_speed_x, paddle_width) && SpeedWithin(ball_speed_x, ball_size - 1),
            "ball x speed must not exceed paddle width or ball size");
    Require(SpeedWithin(ball_speed_y, ball_size - 1),
            "ball y speed must stay below ball size");
}

Json GameConfig::ToJson() const {
    Json json;
    json["arena"] = {{"width", arena_width}, {"height", arena_height}};
    json["fps"] = fps;
    json["ball"] = {{"size", ball_size}, {"speed_x", ball_speed_x}, {"speed_y", ball_speed_y}};
    json["paddle"] = {{"width", paddle_width},
                      {"height", paddle_height},
                      {"player_max_speed", player_max_speed},
                      {"computer_max_speed", computer_max_speed},
                      {"key_step", key_step}};
    json["control"] = ControlSchemeName(control);
    json["serve_flip"] = ServeFlipName(serve_flip);
    json["title"] = title;
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (json.contains("arena") && json["arena"].is_object()) {
        const auto& arena = json["arena"];
        ReadInt(arena, "width", config.arena_width);
        ReadInt(arena, "height", config.arena_height);
    }
    ReadInt(json, "fps", config.fps);
    if (json.contains("ball") && json["ball"].is_object()) {
        const auto& ball = json["ball"];
        ReadInt(ball, "size", config.ball_size);
        ReadInt(ball, "speed_x", config.ball_speed_x);
        ReadInt(ball, "speed_y", config.ball_speed_y);
    }
    if (json.contains("paddle") && json["paddle"].is_object()) {
        const auto& paddle = json["paddle"];
        ReadInt(paddle, "width", config.paddle_width);
        ReadInt(paddle, "height", config.paddle_height);
        ReadInt(paddle, "player_max_speed", config.player_max_speed);
        ReadInt(paddle, "computer_max_speed", config.computer_max_speed);
        ReadInt(paddle, "key_step", config.key_step);
    }
    if (json.contains("control") && json["control"].is_string()) {
        config.control = ParseControlScheme(json["control"].get<std::string>());
    }
    if (json.contains("serve_flip") && json["serve_flip"].is_string()) {
        config.serve_flip = ParseServeFlip(json["serve_flip"].get<std::string>());
    }
    if (json.contains("title") && json["title"].is_string()) {
        config.title = json["title"].get<std::string>();
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(2);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace pong::core
