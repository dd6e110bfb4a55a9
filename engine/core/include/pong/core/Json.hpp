#pragma once

#include <nlohmann/json.hpp>

namespace pong::core {

using Json = nlohmann::json;

}  // namespace pong::core
