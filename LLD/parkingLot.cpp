#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"
#include "parkinglot/parking_facility.hpp"
#include "parkinglot/parking_service.hpp"

using namespace std;
using namespace parkinglot;

/*
 Flow:
    - build the facility once from its layout
    - on entry: checkIn(vehicle) -> first-fit free spot or FacilityFullError
    - on exit: checkOut(vehicle) -> closed ticket + fee, handed to the receipt sink
    - status() / availableSpots(class) for a dashboard
*/

static void printStatus(const ParkingFacility& facility) {
  for (auto& f : facility.status()) {
    cout << "  floor " << f.floor << ": " << f.free << "/" << f.total << " free\n";
  }
}

int main() {
  if (const char* env = getenv(Config::Logging::LEVEL_ENV_VAR)) {
    if (auto lvl = parseLogLevel(env)) Logger::setLevel(*lvl);
    else Logger::warn("Demo", "unknown log level '%s', keeping default", env);
  }

  auto clock = make_shared<ManualClock>(chrono::system_clock::now());

  // a 3-level lot, 10 spots each: 2 bike, 6 car, 2 truck per level
  map<SpotClass,int> counts{{SpotClass::Bike,2},
                            {SpotClass::Car,6},
                            {SpotClass::Truck,2}};
  ParkingFacility facility(FacilityConfig::uniform(3, counts), clock);

  RateTable rates = RateTable::flat(1000);
  rates.withMultiplier(VehicleClass::Small, 50)
       .withMultiplier(VehicleClass::Large, 300);
  rates.dailyCap = 20000;

  InMemoryReceiptLog receipts;
  ParkingService svc(facility, rates, receipts);

  try {
    Vehicle car("KA01AB1234", VehicleClass::Compact);
    Vehicle truck("KA05TR0007", VehicleClass::Large);

    auto ticket = svc.checkIn(car);
    cout << "Parked: " << ticket.to_string() << "\n";
    cout << "Parked: " << svc.checkIn(truck).to_string() << "\n";
    printStatus(facility);

    clock->advance(chrono::minutes(95));
    auto receipt = svc.checkOut(car);
    cout << "Left: " << receipt.record.to_string() << ", fee " << receipt.fee.amount
         << " (" << receipt.fee.billedUnits << " unit(s))\n";

    clock->advance(chrono::minutes(5));
    receipt = svc.checkOut(truck);
    cout << "Left: " << receipt.record.to_string() << ", fee " << receipt.fee.amount << "\n";

    cout << "Revenue: " << receipts.totalRevenue() << "\n";
    printStatus(facility);
  } catch (const ParkingError& e) {
    Logger::error("Demo", "%s", e.what());
    return 1;
  }
  return 0;
}
