#include "parkinglot/parking_facility.hpp"

#include <mutex>
#include <stdexcept>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"

using namespace std;

namespace parkinglot {

ParkingFacility::ParkingFacility(const FacilityConfig& config,
                                 shared_ptr<const Clock> clock,
                                 SpotCompatibility policy)
  : policy_(make_shared<const SpotCompatibility>(move(policy)))
  , clock_(move(clock))
{
  if (!clock_) {
    throw ConfigurationError("facility needs a clock");
  }
  config.validate();

  floors_.reserve(config.floors.size());
  int number = 1;
  for (auto& layout : config.floors) {
    floors_.emplace_back(number++, layout, policy_);
  }
  Logger::debug("Facility", "created %d floor(s), %d spot(s)",
                floorCount(), config.totalSpots());
}

OccupancyRecord ParkingFacility::parkVehicle(const Vehicle& v) {
  unique_lock lock(mtx_);

  if (tickets_.findByVehicle(v.plate())) {
    Logger::warn("Facility", "%s rejected: already parked", v.plate().c_str());
    throw DuplicateEntryError(v.plate());
  }

  for (auto& floor : floors_) {
    auto spotId = floor.tryPark(v);
    if (!spotId) continue;

    try {
      OccupancyRecord record(ids_.next(), v, *spotId, clock_->now());
      tickets_.save(record);
      Logger::info("Facility", "%s (%s) parked at %s, ticket %s", v.plate().c_str(),
                   toString(v.vehicleClass()), toString(*spotId).c_str(), record.ticketId().c_str());
      return record;
    } catch (...) {
      spotAt(*spotId).release();
      throw;
    }
  }

  Logger::warn("Facility", "%s (%s) rejected: no compatible free spot",
               v.plate().c_str(), toString(v.vehicleClass()));
  throw FacilityFullError(v.plate());
}

OccupancyRecord ParkingFacility::unparkVehicle(const Vehicle& v) {
  unique_lock lock(mtx_);
  auto open = tickets_.findByVehicle(v.plate());
  if (!open) {
    Logger::warn("Facility", "unpark %s: no open ticket", v.plate().c_str());
    throw VehicleNotFoundError(v.plate());
  }
  return closeLocked(*open);
}

OccupancyRecord ParkingFacility::unparkByTicket(const string& ticketId) {
  unique_lock lock(mtx_);
  auto open = tickets_.findByTicket(ticketId);
  if (!open) {
    Logger::warn("Facility", "unpark ticket %s: not open", ticketId.c_str());
    throw VehicleNotFoundError(ticketId);
  }
  return closeLocked(*open);
}

OccupancyRecord ParkingFacility::closeLocked(const OccupancyRecord& open) {
  // Close a copy first so a failure below leaves the stored ticket and the spot untouched.
  OccupancyRecord closed = open;
  closed.close(clock_->now());

  ParkingSpot& s = spotAt(closed.spot());
  if (s.isFree() || s.occupant()->plate() != closed.vehicle().plate()) {
    throw InvalidStateError("ticket " + closed.ticketId() + " does not match spot " + toString(closed.spot()));
  }
  s.release();
  tickets_.remove(closed.ticketId());

  Logger::info("Facility", "%s left %s, ticket %s closed", closed.vehicle().plate().c_str(),
               toString(closed.spot()).c_str(), closed.ticketId().c_str());
  return closed;
}

optional<OccupancyRecord> ParkingFacility::findOpenRecord(const string& plate) const {
  shared_lock lock(mtx_);
  return tickets_.findByVehicle(plate);
}

optional<OccupancyRecord> ParkingFacility::findOpenTicket(const string& ticketId) const {
  shared_lock lock(mtx_);
  return tickets_.findByTicket(ticketId);
}

vector<SpotId> ParkingFacility::availableSpots(VehicleClass vc) const {
  shared_lock lock(mtx_);
  vector<SpotId> res;
  for (auto& floor : floors_) {
    auto spots = floor.availableSpots(vc);
    res.insert(res.end(), spots.begin(), spots.end());
  }
  return res;
}

vector<FloorStatus> ParkingFacility::status() const {
  shared_lock lock(mtx_);
  vector<FloorStatus> res;
  res.reserve(floors_.size());
  for (auto& floor : floors_) {
    res.push_back(FloorStatus{floor.number(), floor.spotCount(), floor.freeCount()});
  }
  return res;
}

ParkingSpot ParkingFacility::spot(const SpotId& id) const {
  shared_lock lock(mtx_);
  return spotAt(id);
}

size_t ParkingFacility::openTicketCount() const {
  shared_lock lock(mtx_);
  return tickets_.size();
}

size_t ParkingFacility::floorIndex(int floor) const {
  if (floor < 1 || floor > floorCount()) {
    throw out_of_range("no floor " + to_string(floor));
  }
  return static_cast<size_t>(floor - 1);
}

ParkingSpot& ParkingFacility::spotAt(const SpotId& id) {
  return floors_[floorIndex(id.floor)].spot(id.spot);
}

const ParkingSpot& ParkingFacility::spotAt(const SpotId& id) const {
  return floors_[floorIndex(id.floor)].spot(id.spot);
}

} // namespace parkinglot
