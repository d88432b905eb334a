#pragma once

#include <memory>
#include <optional>

#include "parkinglot/compatibility.hpp"
#include "parkinglot/types.hpp"

namespace parkinglot {

/**
 * @brief One allocation unit; Free or Occupied(vehicle).
 */
class ParkingSpot {
public:
  ParkingSpot(SpotId id, SpotClass sc, std::shared_ptr<const SpotCompatibility> policy);

  const SpotId& id() const noexcept { return id_; }
  SpotClass spotClass() const noexcept { return class_; }

  bool isFree() const noexcept { return !occupant_.has_value(); }
  const std::optional<Vehicle>& occupant() const noexcept { return occupant_; }

  // Class check only, regardless of occupancy.
  bool fits(const Vehicle& v) const;

  bool canAccept(const Vehicle& v) const;

  // Throws InvalidStateError when occupied or incompatible; state is left untouched.
  void assign(const Vehicle& v);

  // Throws InvalidStateError when already free.
  Vehicle release();

private:
  SpotId id_;
  SpotClass class_;
  std::shared_ptr<const SpotCompatibility> policy_;
  std::optional<Vehicle> occupant_;
};

} // namespace parkinglot
