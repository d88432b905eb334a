#pragma once

#include <map>
#include <set>

#include "parkinglot/types.hpp"

namespace parkinglot {

/**
 * @brief Table of which spot classes each vehicle class may occupy.
 *
 * Pairings not in the table are incompatible; fits() never throws.
 * New classes are supported by adding entries with allow().
 */
class SpotCompatibility {
public:
  // Empty table: nothing fits anywhere.
  SpotCompatibility() = default;

  // Small->Bike, Compact->Car, Large->Truck.
  static SpotCompatibility defaultPolicy();

  SpotCompatibility& allow(VehicleClass vc, SpotClass sc);

  bool fits(SpotClass sc, VehicleClass vc) const noexcept;

  std::set<SpotClass> spotClassesFor(VehicleClass vc) const;

private:
  std::map<VehicleClass, std::set<SpotClass>> allowed_;
};

} // namespace parkinglot
