#include "parkinglot/types.hpp"

#include "parkinglot/errors.hpp"

using namespace std;

namespace parkinglot {

Vehicle::Vehicle(string plate, VehicleClass vc)
  : plate_(move(plate)), class_(vc)
{
  if (plate_.empty()) {
    throw ConfigurationError("vehicle plate cannot be empty");
  }
}

const char* toString(VehicleClass vc) {
  switch (vc) {
    case VehicleClass::Small:   return "Small";
    case VehicleClass::Compact: return "Compact";
    case VehicleClass::Large:   return "Large";
  }
  return "Unknown";
}

const char* toString(SpotClass sc) {
  switch (sc) {
    case SpotClass::Bike:  return "Bike";
    case SpotClass::Car:   return "Car";
    case SpotClass::Truck: return "Truck";
  }
  return "Unknown";
}

string toString(const SpotId& id) {
  return "F" + to_string(id.floor) + "-S" + to_string(id.spot);
}

ostream& operator<<(ostream& os, VehicleClass vc) { return os << toString(vc); }
ostream& operator<<(ostream& os, SpotClass sc) { return os << toString(sc); }
ostream& operator<<(ostream& os, const SpotId& id) { return os << toString(id); }

} // namespace parkinglot
