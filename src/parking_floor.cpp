#include "parkinglot/parking_floor.hpp"

#include <stdexcept>
#include <string>

using namespace std;

namespace parkinglot {

ParkingFloor::ParkingFloor(int number, const FloorLayout& layout, shared_ptr<const SpotCompatibility> policy)
  : number_(number), policy_(move(policy))
{
  spots_.reserve(layout.spots.size());
  int spotNumber = 1;
  for (auto sc : layout.spots) {
    spots_.emplace_back(SpotId{number_, spotNumber++}, sc, policy_);
  }
}

int ParkingFloor::freeCount() const {
  int n = 0;
  for (auto& s : spots_)
    if (s.isFree()) ++n;
  return n;
}

optional<SpotId> ParkingFloor::tryPark(const Vehicle& v) {
  for (auto& s : spots_) {
    if (!s.canAccept(v)) continue;
    s.assign(v);
    return s.id();
  }
  return nullopt;
}

optional<SpotId> ParkingFloor::release(const Vehicle& v) {
  for (auto& s : spots_) {
    if (s.isFree() || s.occupant()->plate() != v.plate()) continue;
    s.release();
    return s.id();
  }
  return nullopt;
}

size_t ParkingFloor::indexOf(int spotNumber) const {
  if (spotNumber < 1 || spotNumber > spotCount()) {
    throw out_of_range("floor " + to_string(number_) + " has no spot " + to_string(spotNumber));
  }
  return static_cast<size_t>(spotNumber - 1);
}

ParkingSpot& ParkingFloor::spot(int spotNumber) {
  return spots_[indexOf(spotNumber)];
}

const ParkingSpot& ParkingFloor::spot(int spotNumber) const {
  return spots_[indexOf(spotNumber)];
}

vector<SpotId> ParkingFloor::availableSpots(VehicleClass vc) const {
  vector<SpotId> res;
  for (auto& s : spots_) {
    if (s.isFree() && policy_->fits(s.spotClass(), vc)) res.push_back(s.id());
  }
  return res;
}

} // namespace parkinglot
