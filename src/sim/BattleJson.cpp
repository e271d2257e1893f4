#include "aquarium/sim/BattleJson.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

namespace {

[[nodiscard]] nlohmann::json side_or_null(const std::optional<BattleSide>& s) {
  if (!s) return nullptr;
  return std::string(to_string(*s));
}

} // namespace

void to_json(nlohmann::json& j, const DamageBreakdown& d) {
  j = nlohmann::json{
      {"baseAttack", d.base_attack},
      {"bonusAttack", d.bonus_attack},
      {"waterModifier", d.water_modifier},
      {"finalDamage", d.final_damage},
  };
}

void to_json(nlohmann::json& j, const BattleEvent& e) {
  j = nlohmann::json{
      {"type", std::string(to_string(e.type))},
      {"round", e.round},
      {"turn", e.turn},
      {"sourceSide", side_or_null(e.source_side)},
      {"source", e.source},
      {"sourceName", e.source_name},
      {"targetSide", side_or_null(e.target_side)},
      {"target", e.target},
      {"targetName", e.target_name},
      {"value", e.value},
      {"healthStates",
       {{"playerHealth", e.player_health},
        {"opponentHealth", e.opponent_health},
        {"targetCurrentHealth", e.target_health_after},
        {"targetMaxHealth", e.target_max_health},
        {"targetDied", e.target_died}}},
      {"description", e.description},
  };
  if (e.type == BattleEventType::Attack) j["damage"] = e.damage;
}

void to_json(nlohmann::json& j, const BattlePiece& bp) {
  j = nlohmann::json{
      {"id", bp.piece.id},
      {"name", bp.piece.name},
      {"category", std::string(to_string(bp.piece.category))},
      {"side", std::string(to_string(bp.side))},
      {"attack", bp.buffed.attack},
      {"speed", bp.buffed.speed},
      {"maxHealth", bp.max_health},
      {"currentHealth", bp.current_health},
      {"isDead", bp.dead},
  };
}

void to_json(nlohmann::json& j, const BattleState& s) {
  j = nlohmann::json{
      {"active", s.active},
      {"currentRound", s.current_round},
      {"currentTurn", s.current_turn},
      {"playerHealth", s.player_health},
      {"opponentHealth", s.opponent_health},
      {"playerMaxHealth", s.player_max_health},
      {"opponentMaxHealth", s.opponent_max_health},
      {"playerWaterQuality", s.player_water_quality},
      {"opponentWaterQuality", s.opponent_water_quality},
      {"winner", s.winner ? nlohmann::json(std::string(to_string(*s.winner))) : nlohmann::json(nullptr)},
      {"events", s.events},
      {"playerPieces", s.player_pieces},
      {"opponentPieces", s.opponent_pieces},
  };
}

bool write_json_file(const nlohmann::json& j, const std::filesystem::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    spdlog::warn("write_json_file: cannot open {}", path.string());
    return false;
  }
  f << j.dump(2) << '\n';
  return static_cast<bool>(f);
}

} // namespace aquarium::sim
