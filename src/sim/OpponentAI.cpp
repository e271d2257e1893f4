#include "aquarium/sim/OpponentAI.hpp"

#include "aquarium/sim/Adjacency.hpp"
#include "aquarium/sim/Grid.hpp"
#include "aquarium/sim/WaterQuality.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

namespace {

using Pool = std::vector<const CatalogEntry*>;

[[nodiscard]] const CatalogEntry& pick_uniform(const Pool& pool, RandomSource& rng) {
  return *pool[rng.next_index(pool.size())];
}

template <class Pred>
[[nodiscard]] Pool filter_pool(const Pool& pool, Pred pred) {
  Pool out;
  std::copy_if(pool.begin(), pool.end(), std::back_inserter(out), [&](const CatalogEntry* e) { return pred(*e); });
  return out;
}

// Preferred pool with probability `weight`, any affordable piece otherwise.
[[nodiscard]] const CatalogEntry& pick_weighted(const Pool& preferred, const Pool& all, double weight,
                                                RandomSource& rng) {
  if (rng.chance(weight)) return pick_uniform(preferred, rng);
  return pick_uniform(all, rng);
}

[[nodiscard]] double power_of(PieceCategory category, const Stats& stats, std::size_t abilities) noexcept {
  const bool fish = category == PieceCategory::Fish;
  const double attack_weight = fish ? 1.2 : 0.5;
  const double speed_weight = fish ? 0.3 : 0.1;

  double utility = 0.0;
  if (category == PieceCategory::Plant) utility = 5.0;
  else if (category == PieceCategory::Equipment) utility = 3.0;

  return stats.attack * attack_weight + stats.health * 1.0 + stats.speed * speed_weight +
         static_cast<double>(abilities) * 2.0 + utility;
}

[[nodiscard]] bool improves_water(const CatalogEntry& e) {
  return e.category == PieceCategory::Plant ||
         (e.category == PieceCategory::Equipment && e.tags.count("filter") > 0);
}

} // namespace

std::optional<CatalogEntry> select_piece(const PieceCatalog& catalog, int round, int budget, int water_quality,
                                         int loss_streak, RandomSource& rng) {
  Pool affordable;
  for (const CatalogEntry& e : catalog.entries()) {
    if (e.cost <= budget) affordable.push_back(&e);
  }
  if (affordable.empty()) return std::nullopt;

  const bool toxic = water_quality <= kPoisonThreshold;
  const bool excellent = water_quality >= kExcellentThreshold;
  const bool needs_water_help = toxic || (loss_streak >= 2 && water_quality < 7);

  if (needs_water_help) {
    const Pool helpers = filter_pool(affordable, improves_water);
    if (!helpers.empty() && rng.chance(0.8)) {
      spdlog::debug("AI: water quality {} is poor, buying plants/filters", water_quality);
      return pick_uniform(helpers, rng);
    }
  }

  if (excellent) {
    const Pool fish = filter_pool(affordable, [](const CatalogEntry& e) { return e.category == PieceCategory::Fish; });
    if (!fish.empty() && rng.chance(0.6)) {
      spdlog::debug("AI: water quality {} is excellent, buying fish", water_quality);
      return pick_uniform(fish, rng);
    }
  }

  if (round <= 3) return pick_uniform(affordable, rng);

  if (round <= 7) {
    const Pool good = filter_pool(affordable, [](const CatalogEntry& e) { return e.cost >= 3; });
    if (!good.empty()) return pick_weighted(good, affordable, 0.7, rng);
    return pick_uniform(affordable, rng);
  }

  const Pool expensive = filter_pool(affordable, [](const CatalogEntry& e) { return e.cost >= 4; });
  if (!expensive.empty()) return pick_weighted(expensive, affordable, 0.85, rng);
  return pick_uniform(affordable, rng);
}

int spending_budget(int gold, int round, int loss_streak, int win_streak) noexcept {
  int budget = gold;

  if (round <= 3) {
    budget = std::max(0, gold - 1);
  } else if (round <= 5) {
    if (loss_streak >= 2) {
      budget = gold;
    } else if (gold >= 20 && win_streak >= 2) {
      budget = gold - 10;
    } else {
      budget = std::max(0, gold - 2);
    }
  } else if (round <= 10) {
    if (loss_streak >= 3) {
      budget = gold;
    } else if (win_streak >= 3) {
      budget = std::max(0, gold - 20);
    } else {
      budget = std::max(0, gold - 10);
    }
  } else {
    budget = loss_streak >= 2 ? gold : std::max(0, gold - 5);
  }

  return std::max(0, budget);
}

double piece_power(const Piece& piece) noexcept {
  return power_of(piece.category, piece.stats, piece.abilities.size());
}

double piece_power(const CatalogEntry& entry) noexcept {
  return power_of(entry.category, entry.stats, entry.abilities.size());
}

std::optional<Position> find_support_position(const Tank& tank, const Piece& piece) {
  std::optional<Position> best;
  int best_score = -1;

  for (int y = 0; y < kTankHeight; ++y) {
    for (int x = 0; x < kTankWidth; ++x) {
      const Position anchor{x, y};
      if (!is_free_position(tank, piece, anchor)) continue;

      const int score = count_adjacent_fish(tank, piece, anchor);
      if (score > best_score) {
        best_score = score;
        best = anchor;
      }
    }
  }
  return best;
}

std::optional<Position> choose_position(const Tank& tank, const Piece& piece) {
  switch (piece.category) {
    case PieceCategory::Consumable:
    case PieceCategory::Plant:
    case PieceCategory::Equipment:
      return find_support_position(tank, piece);
    case PieceCategory::Fish:
    default:
      return find_first_free_position(tank, piece);
  }
}

std::optional<std::string> try_replace_weaker(Tank& tank, const CatalogEntry& candidate, int round) {
  if (tank.pieces.size() < kReplacementMinPieces) return std::nullopt;

  const double candidate_power = piece_power(candidate);
  const double threshold = round > 10 ? 1.2 : 1.5;
  const bool equipment_protected = tank.pieces.size() < kEquipmentProtectionLimit;

  const Piece* weakest = nullptr;
  double weakest_power = 0.0;
  for (const Piece& p : tank.pieces) {
    if (equipment_protected && p.category == PieceCategory::Equipment) continue;

    const double power = piece_power(p);
    if (power * threshold >= candidate_power) continue;
    if (!weakest || power < weakest_power) {
      weakest = &p;
      weakest_power = power;
    }
  }
  if (!weakest) return std::nullopt;

  Piece removed = discard_piece(tank, weakest->id);

  const Piece trial = make_piece(candidate, kEmptyCell);
  const std::optional<Position> pos = find_first_free_position(tank, trial);
  if (!pos) {
    // Nowhere to put the candidate; undo.
    tank.pieces.push_back(removed);
    place_on_grid(tank, removed);
    refresh_water_quality(tank);
    return std::nullopt;
  }

  const PieceId id = acquire_piece(tank, candidate);
  place_piece(tank, id, *pos);
  spdlog::debug("AI: replaced {} ({:.1f}) with {} ({:.1f}) at ({},{})", removed.name, weakest_power,
                candidate.name, candidate_power, pos->x, pos->y);
  return removed.name;
}

AcquisitionReport run_opponent_shop(Tank& tank, int gold, int round, int loss_streak, int win_streak,
                                    const PieceCatalog& catalog, RandomSource& rng) {
  AcquisitionReport report{};
  report.budget = spending_budget(gold, round, loss_streak, win_streak);

  spdlog::debug("AI: round {} budget {}g of {}g (L{} W{}), {} pieces on board", round, report.budget, gold,
                loss_streak, win_streak, tank.pieces.size());

  int budget = report.budget;
  int failures = 0;
  while (budget > 0 && failures < kMaxConsecutiveFailures) {
    const std::optional<CatalogEntry> choice = select_piece(catalog, round, budget, tank.water_quality,
                                                            loss_streak, rng);
    if (!choice || choice->cost > budget) {
      ++failures;
      continue;
    }

    const Piece trial = make_piece(*choice, kEmptyCell);
    if (const std::optional<Position> pos = choose_position(tank, trial)) {
      const PieceId id = acquire_piece(tank, *choice);
      place_piece(tank, id, *pos);
      report.bought.push_back(choice->name);
      spdlog::debug("AI: bought {} for {}g at ({},{})", choice->name, choice->cost, pos->x, pos->y);
    } else if (std::optional<std::string> replaced = try_replace_weaker(tank, *choice, round)) {
      report.bought.push_back(choice->name);
      report.replaced.push_back(std::move(*replaced));
    } else {
      ++failures;
      continue;
    }

    budget -= choice->cost;
    report.spent += choice->cost;
    failures = 0;
  }

  report.consumed = process_consumables(tank);
  refresh_water_quality(tank);
  report.remaining_gold = gold - report.spent;

  spdlog::debug("AI: shop done, {} pieces, {}g spent, {}g left, water {}", tank.pieces.size(), report.spent,
                report.remaining_gold, tank.water_quality);
  return report;
}

int generate_opponent_acquisitions(Tank& tank, int gold, int round, int loss_streak, int win_streak,
                                   const PieceCatalog& catalog, RandomSource& rng) {
  return run_opponent_shop(tank, gold, round, loss_streak, win_streak, catalog, rng).remaining_gold;
}

} // namespace aquarium::sim
