#include "aquarium/sim/Battle.hpp"

#include "aquarium/sim/Errors.hpp"
#include "aquarium/sim/WaterQuality.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

namespace {

// Attacker reference that stays valid while the turn runs (indices, never pointers
// into vectors we might touch).
struct AttackerSlot {
  BattleSide side{BattleSide::Player};
  std::size_t index{0};
  int speed{0};
  double tie_break{0.0};
};

void stamp_totals(const BattleState& state, BattleEvent& e) {
  e.player_health = side_health(state.player_pieces);
  e.opponent_health = side_health(state.opponent_pieces);
}

[[nodiscard]] BattleEvent make_event(const BattleState& state, BattleEventType type) {
  BattleEvent e{};
  e.type = type;
  e.round = state.current_round;
  e.turn = state.current_turn;
  return e;
}

void push(BattleState& state, std::vector<BattleEvent>& turn_events, BattleEvent e) {
  e.description = describe_event(e);
  state.events.push_back(e);
  turn_events.push_back(std::move(e));
}

void emit_death(BattleState& state, std::vector<BattleEvent>& out, const BattlePiece& victim,
                std::optional<BattleSide> killer_side, PieceId killer, const std::string& killer_name) {
  BattleEvent d = make_event(state, BattleEventType::Death);
  d.source_side = killer_side;
  d.source = killer;
  d.source_name = killer_name;
  d.target_side = victim.side;
  d.target = victim.piece.id;
  d.target_name = victim.piece.name;
  d.target_max_health = victim.max_health;
  d.target_died = true;
  stamp_totals(state, d);
  push(state, out, std::move(d));
}

void apply_poison(BattleState& state, BattleSide side, std::vector<BattleEvent>& out) {
  if (!is_poisoned(state.water_quality(side))) return;

  std::vector<BattlePiece>& pieces = state.side_pieces(side);
  for (BattlePiece& bp : pieces) {
    if (!bp.can_attack()) continue; // alive fish only

    const int before = bp.current_health;
    bp.current_health = std::max(0, bp.current_health - kPoisonDamage);
    if (bp.current_health == 0) bp.dead = true;

    BattleEvent e = make_event(state, BattleEventType::Poison);
    e.target_side = side;
    e.target = bp.piece.id;
    e.target_name = bp.piece.name;
    e.value = before - bp.current_health;
    e.target_health_after = bp.current_health;
    e.target_max_health = bp.max_health;
    e.target_died = bp.dead;
    stamp_totals(state, e);
    push(state, out, std::move(e));

    if (bp.dead) emit_death(state, out, bp, std::nullopt, kEmptyCell, "poison");
  }
}

void finish(BattleState& state, BattleOutcome outcome) {
  state.winner = outcome;
  state.active = false;
  spdlog::debug("battle finished on turn {}: winner={} ({} vs {})", state.current_turn, to_string(outcome),
                state.player_health, state.opponent_health);
}

} // namespace

BattlePhase BattleState::phase() const noexcept {
  if (!initialized) return BattlePhase::Init;
  if (active) return BattlePhase::Active;
  if (!winner) return BattlePhase::Init;

  switch (*winner) {
    case BattleOutcome::Player:   return BattlePhase::PlayerWin;
    case BattleOutcome::Opponent: return BattlePhase::OpponentWin;
    default:                      return BattlePhase::Draw;
  }
}

BattlePiece* BattleState::find(BattleSide s, PieceId id) noexcept {
  std::vector<BattlePiece>& v = side_pieces(s);
  const auto it = std::find_if(v.begin(), v.end(), [id](const BattlePiece& bp) { return bp.piece.id == id; });
  return it == v.end() ? nullptr : &*it;
}

std::vector<BattlePiece> make_battle_pieces(const Tank& tank, BattleSide side) {
  std::vector<BattlePiece> out;
  out.reserve(tank.pieces.size());

  for (const Piece& p : tank.pieces) {
    if (!p.is_placed()) continue;

    BattlePiece bp{};
    bp.piece = p;
    bp.side = side;
    bp.buffed = compute_buffed_stats(p, tank.pieces);
    bp.max_health = std::max(0, bp.buffed.health);
    bp.current_health = bp.max_health;
    // Nothing left to fight with: starts out dead.
    bp.dead = bp.max_health <= 0;
    out.push_back(std::move(bp));
  }
  return out;
}

int side_health(std::span<const BattlePiece> pieces) noexcept {
  return std::accumulate(pieces.begin(), pieces.end(), 0, [](int sum, const BattlePiece& bp) {
    return bp.dead ? sum : sum + bp.current_health;
  });
}

BattleState initialize_battle(const Tank& player, const Tank& opponent, int round) {
  BattleState s{};
  s.initialized = true;
  s.active = true;
  s.current_round = round;
  s.current_turn = 1;

  s.player_pieces = make_battle_pieces(player, BattleSide::Player);
  s.opponent_pieces = make_battle_pieces(opponent, BattleSide::Opponent);

  const auto sum_max = [](const std::vector<BattlePiece>& v) {
    return std::accumulate(v.begin(), v.end(), 0, [](int sum, const BattlePiece& bp) { return sum + bp.max_health; });
  };
  s.player_max_health = sum_max(s.player_pieces);
  s.opponent_max_health = sum_max(s.opponent_pieces);
  s.player_health = s.player_max_health;
  s.opponent_health = s.opponent_max_health;

  s.player_water_quality = compute_water_quality(player);
  s.opponent_water_quality = compute_water_quality(opponent);

  spdlog::debug("battle initialized: player {} pieces / {} hp (water {}), opponent {} pieces / {} hp (water {})",
                s.player_pieces.size(), s.player_max_health, s.player_water_quality, s.opponent_pieces.size(),
                s.opponent_max_health, s.opponent_water_quality);
  return s;
}

std::optional<BattleOutcome> resolve_outcome(int player_health, int opponent_health, int turn) noexcept {
  // Player checked first: simultaneous wipe-outs go to the opponent.
  if (player_health <= 0) return BattleOutcome::Opponent;
  if (opponent_health <= 0) return BattleOutcome::Player;
  if (turn >= kMaxBattleTurns) return BattleOutcome::Draw;
  return std::nullopt;
}

std::vector<BattleEvent> advance_turn(BattleState& state, RandomSource& rng) {
  if (!state.initialized || !state.active) {
    throw BattleNotActive("advance_turn called on a battle that is not active");
  }

  std::vector<BattleEvent> out;

  {
    BattleEvent start = make_event(state, BattleEventType::TurnStart);
    stamp_totals(state, start);
    push(state, out, std::move(start));
  }

  apply_poison(state, BattleSide::Player, out);
  apply_poison(state, BattleSide::Opponent, out);

  // Attacker pool: alive fish of both sides.
  std::vector<AttackerSlot> attackers;
  for (const BattleSide side : {BattleSide::Player, BattleSide::Opponent}) {
    const std::vector<BattlePiece>& pieces = state.side_pieces(side);
    for (std::size_t i = 0; i < pieces.size(); ++i) {
      if (pieces[i].can_attack()) attackers.push_back(AttackerSlot{side, i, pieces[i].buffed.speed, 0.0});
    }
  }

  if (attackers.empty()) {
    state.player_health = 0;
    state.opponent_health = 0;

    BattleEvent e = make_event(state, BattleEventType::DoubleLoss);
    push(state, out, std::move(e));

    finish(state, BattleOutcome::Draw);
    return out;
  }

  // Speed descending; exact ties ordered by an independent uniform draw.
  for (AttackerSlot& a : attackers) a.tie_break = rng.next_unit();
  std::stable_sort(attackers.begin(), attackers.end(), [](const AttackerSlot& a, const AttackerSlot& b) {
    if (a.speed != b.speed) return a.speed > b.speed;
    return a.tie_break < b.tie_break;
  });

  for (const AttackerSlot& slot : attackers) {
    const BattlePiece& attacker = state.side_pieces(slot.side)[slot.index];
    if (attacker.dead) continue; // died earlier this turn

    const BattleSide enemy_side = other_side(slot.side);
    std::vector<BattlePiece>& enemy_pieces = state.side_pieces(enemy_side);

    std::vector<std::size_t> alive_enemies;
    for (std::size_t i = 0; i < enemy_pieces.size(); ++i) {
      if (enemy_pieces[i].alive()) alive_enemies.push_back(i);
    }
    if (alive_enemies.empty()) break;

    BattlePiece& target = enemy_pieces[alive_enemies[rng.next_index(alive_enemies.size())]];

    DamageBreakdown dmg{};
    dmg.base_attack = attacker.piece.stats.attack;
    dmg.bonus_attack = attacker.buffed.attack - attacker.piece.stats.attack;
    dmg.final_damage = damage_after_water(attacker.buffed.attack, state.water_quality(slot.side));
    dmg.water_modifier = dmg.final_damage - attacker.buffed.attack;

    const int before = target.current_health;
    target.current_health = std::max(0, target.current_health - dmg.final_damage);
    if (target.current_health == 0) target.dead = true;

    BattleEvent e = make_event(state, BattleEventType::Attack);
    e.source_side = slot.side;
    e.source = attacker.piece.id;
    e.source_name = attacker.piece.name;
    e.target_side = enemy_side;
    e.target = target.piece.id;
    e.target_name = target.piece.name;
    e.value = before - target.current_health;
    e.damage = dmg;
    e.target_health_after = target.current_health;
    e.target_max_health = target.max_health;
    e.target_died = target.dead;
    stamp_totals(state, e);
    push(state, out, std::move(e));

    if (target.dead) emit_death(state, out, target, slot.side, attacker.piece.id, attacker.piece.name);
  }

  state.player_health = side_health(state.player_pieces);
  state.opponent_health = side_health(state.opponent_pieces);

  if (const std::optional<BattleOutcome> outcome =
          resolve_outcome(state.player_health, state.opponent_health, state.current_turn)) {
    finish(state, *outcome);
  }

  if (state.active) ++state.current_turn;
  return out;
}

BattleOutcome run_battle(BattleState& state, RandomSource& rng) {
  if (!state.initialized) throw BattleNotActive("run_battle called before initialize_battle");
  while (state.active) {
    (void)advance_turn(state, rng);
  }
  return state.winner.value_or(BattleOutcome::Draw);
}

} // namespace aquarium::sim
