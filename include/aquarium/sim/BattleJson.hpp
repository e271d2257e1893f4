#pragma once

#include "Battle.hpp"
#include "BattleEvents.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace aquarium::sim {

// Wire shape handed to presentation layers (battle log viewers, replays in a UI).
void to_json(nlohmann::json& j, const DamageBreakdown& d);
void to_json(nlohmann::json& j, const BattleEvent& e);
void to_json(nlohmann::json& j, const BattlePiece& bp);
void to_json(nlohmann::json& j, const BattleState& s);

// Writes `j` pretty-printed. Returns false if the file cannot be written.
bool write_json_file(const nlohmann::json& j, const std::filesystem::path& path);

} // namespace aquarium::sim
