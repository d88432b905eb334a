#include "parkinglot/parking_spot.hpp"

#include "parkinglot/errors.hpp"

using namespace std;

namespace parkinglot {

ParkingSpot::ParkingSpot(SpotId id, SpotClass sc, shared_ptr<const SpotCompatibility> policy)
  : id_(id), class_(sc), policy_(move(policy))
{
  if (!policy_) {
    throw ConfigurationError("spot " + toString(id_) + " has no compatibility policy");
  }
}

bool ParkingSpot::fits(const Vehicle& v) const {
  return policy_->fits(class_, v.vehicleClass());
}

bool ParkingSpot::canAccept(const Vehicle& v) const {
  return isFree() && fits(v);
}

void ParkingSpot::assign(const Vehicle& v) {
  if (!isFree()) {
    throw InvalidStateError("spot " + toString(id_) + " already occupied by " + occupant_->plate());
  }
  if (!fits(v)) {
    throw InvalidStateError(string("spot ") + toString(id_) + " (" + toString(class_) +
                            ") cannot take " + toString(v.vehicleClass()) + " vehicle " + v.plate());
  }
  occupant_ = v;
}

Vehicle ParkingSpot::release() {
  if (isFree()) {
    throw InvalidStateError("spot " + toString(id_) + " is already free");
  }
  Vehicle v = *occupant_;
  occupant_.reset();
  return v;
}

} // namespace parkinglot
