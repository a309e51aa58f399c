#include "network/StateMapper.hpp"

namespace blockfall::core {

void to_json(nlohmann::json& j, const Vector& v)
{
    j = nlohmann::json{{"x", v.x}, {"y", v.y}};
}

void to_json(nlohmann::json& j, const Block& block)
{
    j = nlohmann::json{
        {"zero", block.origin()},
        {"vectors", block.vectors()},
        {"degrees", block.degrees()}
    };
}

void to_json(nlohmann::json& j, const CollisionField& field)
{
    j = nlohmann::json::array();
    for (const auto& row : field.grid()) {
        auto jsonRow = nlohmann::json::array();
        for (const auto cell : row) {
            jsonRow.push_back(cell == CellState::Occupied ? 1 : 0);
        }
        j.push_back(std::move(jsonRow));
    }
}

void to_json(nlohmann::json& j, const PlayerState& player)
{
    j = nlohmann::json{{"playerId", player.playerId}, {"points", player.points}};
}

void to_json(nlohmann::json& j, const GameConfig& config)
{
    j = nlohmann::json{{"cols", config.cols}, {"rows", config.rows}, {"name", config.name}};
}

void to_json(nlohmann::json& j, const GameState& state)
{
    j = nlohmann::json{
        {"id", state.id},
        {"owner", state.owner},
        {"name", state.config.name},
        {"cols", state.config.cols},
        {"rows", state.config.rows},
        {"status", toString(state.status)},
        {"matrix", state.matrix},
        {"blockCount", state.blockCount},
        {"lineCount", state.lineCount},
        {"level", state.level},
        {"players", state.players},
        {"currentPlayer", state.currentPlayerIndex},
        {"stepCount", state.stepCount}
    };

    // Absent blocks are left out, not sent as null
    if (state.activeBlock) {
        j["activeBlock"] = *state.activeBlock;
    }
    if (state.nextBlock) {
        j["nextBlock"] = *state.nextBlock;
    }
}

void from_json(const nlohmann::json& j, GameConfig& config)
{
    j.at("cols").get_to(config.cols);
    j.at("rows").get_to(config.rows);
    j.at("name").get_to(config.name);
}

} // namespace blockfall::core
