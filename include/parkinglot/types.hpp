#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace parkinglot {

/*
 Data models: the static description of the facility (spot/vehicle classes,
 spot identity) and the vehicle value that moves through it.
*/

enum class VehicleClass : std::uint8_t { Small, Compact, Large };

enum class SpotClass : std::uint8_t { Bike, Car, Truck };

const char* toString(VehicleClass vc);
const char* toString(SpotClass sc);

using Timestamp = std::chrono::system_clock::time_point;

// Integer currency subunits (e.g. cents).
using Money = std::int64_t;

/**
 * @brief A vehicle is identified by its plate; immutable once constructed.
 */
class Vehicle {
public:
  Vehicle(std::string plate, VehicleClass vc);

  const std::string& plate() const noexcept { return plate_; }
  VehicleClass vehicleClass() const noexcept { return class_; }

  bool operator==(const Vehicle& o) const {
    return plate_ == o.plate_ && class_ == o.class_;
  }
  bool operator!=(const Vehicle& o) const { return !(*this == o); }

private:
  std::string plate_;
  VehicleClass class_;
};

/**
 * @brief (floor number, spot number), both 1-based. Unique within a facility.
 */
struct SpotId {
  int floor = 0;
  int spot = 0;

  bool operator==(const SpotId& o) const { return floor == o.floor && spot == o.spot; }
  bool operator!=(const SpotId& o) const { return !(*this == o); }
  bool operator<(const SpotId& o) const {
    return floor < o.floor || (floor == o.floor && spot < o.spot);
  }
};

std::string toString(const SpotId& id);

std::ostream& operator<<(std::ostream& os, VehicleClass vc);
std::ostream& operator<<(std::ostream& os, SpotClass sc);
std::ostream& operator<<(std::ostream& os, const SpotId& id);

} // namespace parkinglot
