#include "aquarium/sim/BattleEvents.hpp"

namespace aquarium::sim {

namespace {

void append_side(std::string& out, const std::optional<BattleSide>& side) {
  if (!side) return;
  out.append(*side == BattleSide::Player ? "[P] " : "[O] ");
}

} // namespace

std::string describe_event(const BattleEvent& e) {
  std::string out;
  out.reserve(128);

  switch (e.type) {
    case BattleEventType::TurnStart:
      out.append("--- Turn ");
      out.append(std::to_string(e.turn));
      out.append(" ---");
      break;

    case BattleEventType::Poison:
      append_side(out, e.target_side);
      out.append(e.target_name);
      out.append(" takes ");
      out.append(std::to_string(e.value));
      out.append(" poison damage from dirty water");
      if (e.target_died) {
        out.append(" and dies");
      } else {
        out.append(" -> ");
        out.append(std::to_string(e.target_health_after));
        out.append("/");
        out.append(std::to_string(e.target_max_health));
        out.append(" HP");
      }
      break;

    case BattleEventType::Attack:
      append_side(out, e.source_side);
      out.append(e.source_name);
      out.append(" attacks ");
      append_side(out, e.target_side);
      out.append(e.target_name);
      out.append(": ");
      out.append(std::to_string(e.damage.base_attack));
      out.append(" base");
      if (e.damage.bonus_attack != 0) {
        out.append(e.damage.bonus_attack > 0 ? " + " : " - ");
        out.append(std::to_string(e.damage.bonus_attack > 0 ? e.damage.bonus_attack : -e.damage.bonus_attack));
        out.append(" bonus");
      }
      if (e.damage.water_modifier != 0) {
        out.append(e.damage.water_modifier > 0 ? " + " : " - ");
        out.append(std::to_string(e.damage.water_modifier > 0 ? e.damage.water_modifier : -e.damage.water_modifier));
        out.append(" water");
      }
      out.append(" = ");
      out.append(std::to_string(e.damage.final_damage));
      out.append(" dmg -> ");
      if (e.target_died) {
        out.append("KO");
      } else {
        out.append(std::to_string(e.target_health_after));
        out.append("/");
        out.append(std::to_string(e.target_max_health));
        out.append(" HP");
      }
      break;

    case BattleEventType::Death:
      append_side(out, e.target_side);
      out.append(e.target_name);
      out.append(" has been defeated");
      break;

    case BattleEventType::DoubleLoss:
      out.append("No attacking units remain, both sides lose");
      break;

    default:
      out.append("Unknown event");
      break;
  }

  return out;
}

} // namespace aquarium::sim
