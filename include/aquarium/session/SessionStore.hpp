#pragma once

#include "GameSession.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aquarium::session {

// Owns live sessions keyed by id. Injected into whatever transport drives the game.
class SessionStore {
public:
  virtual ~SessionStore() = default;

  // Throws SessionError when the id is already taken.
  virtual GameSession& create(const std::string& id, const sim::PieceCatalog& catalog, int base_water_quality) = 0;

  [[nodiscard]] virtual GameSession* find(std::string_view id) noexcept = 0;

  // Throws SessionError.
  [[nodiscard]] virtual GameSession& get(std::string_view id) = 0;

  virtual bool erase(std::string_view id) = 0;

  [[nodiscard]] virtual std::size_t size() const noexcept = 0;
  [[nodiscard]] virtual std::vector<std::string> ids() const = 0;
};

class InMemorySessionStore final : public SessionStore {
public:
  GameSession& create(const std::string& id, const sim::PieceCatalog& catalog, int base_water_quality) override;
  [[nodiscard]] GameSession* find(std::string_view id) noexcept override;
  [[nodiscard]] GameSession& get(std::string_view id) override;
  bool erase(std::string_view id) override;
  [[nodiscard]] std::size_t size() const noexcept override { return sessions_.size(); }
  [[nodiscard]] std::vector<std::string> ids() const override;

private:
  // Sessions are heap-allocated so references stay valid across inserts.
  std::map<std::string, std::unique_ptr<GameSession>, std::less<>> sessions_{};
};

} // namespace aquarium::session
