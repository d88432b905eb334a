#include "parkinglot/compatibility.hpp"

using namespace std;

namespace parkinglot {

SpotCompatibility SpotCompatibility::defaultPolicy() {
  SpotCompatibility policy;
  policy.allow(VehicleClass::Small, SpotClass::Bike)
        .allow(VehicleClass::Compact, SpotClass::Car)
        .allow(VehicleClass::Large, SpotClass::Truck);
  return policy;
}

SpotCompatibility& SpotCompatibility::allow(VehicleClass vc, SpotClass sc) {
  allowed_[vc].insert(sc);
  return *this;
}

bool SpotCompatibility::fits(SpotClass sc, VehicleClass vc) const noexcept {
  auto it = allowed_.find(vc);
  if (it == allowed_.end()) return false;
  return it->second.count(sc) > 0;
}

set<SpotClass> SpotCompatibility::spotClassesFor(VehicleClass vc) const {
  auto it = allowed_.find(vc);
  if (it == allowed_.end()) return {};
  return it->second;
}

} // namespace parkinglot
