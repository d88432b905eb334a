#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "parkinglot/config.hpp"
#include "parkinglot/parking_spot.hpp"

namespace parkinglot {

/**
 * @brief Spots of one floor, kept in ascending spot-number order.
 *
 * The scan order is the observable placement rule: the lowest-numbered
 * spot that can accept a vehicle always wins.
 */
class ParkingFloor {
public:
  ParkingFloor(int number, const FloorLayout& layout, std::shared_ptr<const SpotCompatibility> policy);

  int number() const noexcept { return number_; }
  int spotCount() const noexcept { return static_cast<int>(spots_.size()); }
  int freeCount() const;

  // Assigns the first spot that can accept `v`.
  std::optional<SpotId> tryPark(const Vehicle& v);

  // Frees the spot holding v.plate(), if it is on this floor.
  std::optional<SpotId> release(const Vehicle& v);

  // Throws std::out_of_range for a number outside [1, spotCount()].
  ParkingSpot& spot(int spotNumber);
  const ParkingSpot& spot(int spotNumber) const;

  std::vector<SpotId> availableSpots(VehicleClass vc) const;

private:
  std::size_t indexOf(int spotNumber) const;

  int number_;
  std::shared_ptr<const SpotCompatibility> policy_;
  std::vector<ParkingSpot> spots_;
};

} // namespace parkinglot
