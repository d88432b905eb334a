#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "parkinglot/clock.hpp"
#include "parkinglot/compatibility.hpp"
#include "parkinglot/config.hpp"
#include "parkinglot/occupancy_record.hpp"
#include "parkinglot/parking_floor.hpp"
#include "parkinglot/ticket_id.hpp"
#include "parkinglot/ticket_repository.hpp"

namespace parkinglot {

struct FloorStatus {
  int floor = 0;
  int total = 0;
  int free = 0;
};

/**
 * @brief A single facility: its floors, spots and open tickets.
 *
 * Placement is first fit: floors in ascending number, then spots in
 * ascending number. park/unpark are serialized by one facility-wide lock;
 * queries take it shared. Every failing call leaves the state unchanged.
 */
class ParkingFacility {
public:
  // Throws ConfigurationError for an invalid layout or a null clock.
  ParkingFacility(const FacilityConfig& config,
                  std::shared_ptr<const Clock> clock,
                  SpotCompatibility policy = SpotCompatibility::defaultPolicy());

  ParkingFacility(const ParkingFacility&) = delete;
  ParkingFacility& operator=(const ParkingFacility&) = delete;

  // Throws DuplicateEntryError or FacilityFullError.
  OccupancyRecord parkVehicle(const Vehicle& v);

  // Returns the closed record; throws VehicleNotFoundError.
  OccupancyRecord unparkVehicle(const Vehicle& v);
  OccupancyRecord unparkByTicket(const std::string& ticketId);

  std::optional<OccupancyRecord> findOpenRecord(const std::string& plate) const;
  std::optional<OccupancyRecord> findOpenTicket(const std::string& ticketId) const;

  // Free compatible spots in placement order.
  std::vector<SpotId> availableSpots(VehicleClass vc) const;

  std::vector<FloorStatus> status() const;

  // Snapshot of one spot; throws std::out_of_range for an unknown id.
  ParkingSpot spot(const SpotId& id) const;

  int floorCount() const noexcept { return static_cast<int>(floors_.size()); }
  std::size_t openTicketCount() const;

private:
  std::size_t floorIndex(int floor) const;
  ParkingSpot& spotAt(const SpotId& id);
  const ParkingSpot& spotAt(const SpotId& id) const;
  OccupancyRecord closeLocked(const OccupancyRecord& open);

  std::shared_ptr<const SpotCompatibility> policy_;
  std::shared_ptr<const Clock> clock_;
  std::vector<ParkingFloor> floors_;
  TicketRepository tickets_;
  TicketIdGenerator ids_;
  mutable std::shared_mutex mtx_;
};

} // namespace parkinglot
