#pragma once

#include <nlohmann/json.hpp>

#include "core/Block.hpp"
#include "core/CollisionField.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"

// JSON mapping of the core types. Declared in the core namespace so that
// nlohmann::json finds them by argument-dependent lookup.
namespace blockfall::core {

void to_json(nlohmann::json& j, const Vector& v);
void to_json(nlohmann::json& j, const Block& block);
void to_json(nlohmann::json& j, const CollisionField& field); // rows of 0/1
void to_json(nlohmann::json& j, const PlayerState& player);
void to_json(nlohmann::json& j, const GameConfig& config);
void to_json(nlohmann::json& j, const GameState& state);

/// Requires "cols", "rows" and "name".
void from_json(const nlohmann::json& j, GameConfig& config);

} // namespace blockfall::core
