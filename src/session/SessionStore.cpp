#include "aquarium/session/SessionStore.hpp"

#include "aquarium/sim/Errors.hpp"

#include <spdlog/spdlog.h>

namespace aquarium::session {

GameSession& InMemorySessionStore::create(const std::string& id, const sim::PieceCatalog& catalog,
                                          int base_water_quality) {
  if (sessions_.find(id) != sessions_.end()) throw SessionError("session '" + id + "' already exists");

  auto [it, inserted] = sessions_.emplace(id, std::make_unique<GameSession>(id, catalog, base_water_quality));
  (void)inserted;
  spdlog::debug("session '{}' created ({} live)", id, sessions_.size());
  return *it->second;
}

GameSession* InMemorySessionStore::find(std::string_view id) noexcept {
  const auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second.get();
}

GameSession& InMemorySessionStore::get(std::string_view id) {
  GameSession* s = find(id);
  if (!s) throw SessionError("no session '" + std::string(id) + "'");
  return *s;
}

bool InMemorySessionStore::erase(std::string_view id) {
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) return false;
  sessions_.erase(it);
  return true;
}

std::vector<std::string> InMemorySessionStore::ids() const {
  std::vector<std::string> out;
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) out.push_back(id);
  return out;
}

} // namespace aquarium::session
