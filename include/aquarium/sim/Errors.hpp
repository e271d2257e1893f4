#pragma once

#include <stdexcept>
#include <string>

namespace aquarium {

// Root of every caller-visible failure raised by the simulation core.
// All of these are local and synchronous; state is left untouched when thrown.
class SimError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Target cells are out of bounds or collide with another piece.
class InvalidPlacement : public SimError {
public:
  using SimError::SimError;
};

// Referenced piece id does not exist in the tank.
class PieceNotFound : public SimError {
public:
  using SimError::SimError;
};

// Action attempted outside its allowed game phase.
class PhaseViolation : public SimError {
public:
  using SimError::SimError;
};

// Advancing a battle that was never initialized or has already finished.
class BattleNotActive : public SimError {
public:
  using SimError::SimError;
};

// Catalog file missing, malformed, or referencing an unknown piece.
class CatalogError : public SimError {
public:
  using SimError::SimError;
};

// Session id unknown to the store, or already taken on create.
class SessionError : public SimError {
public:
  using SimError::SimError;
};

} // namespace aquarium
