#pragma once

#include <optional>
#include <string>

#include "parkinglot/types.hpp"

namespace parkinglot {

/**
 * @brief The ticket: proof of one park event.
 *
 * Open while the vehicle is parked; close() stamps the exit time exactly
 * once and the record stays Closed afterwards.
 */
class OccupancyRecord {
public:
  OccupancyRecord(std::string ticketId, Vehicle vehicle, SpotId spot, Timestamp entry);

  const std::string& ticketId() const noexcept { return ticketId_; }
  const Vehicle& vehicle() const noexcept { return vehicle_; }
  const SpotId& spot() const noexcept { return spot_; }
  Timestamp entryTime() const noexcept { return entry_; }
  const std::optional<Timestamp>& exitTime() const noexcept { return exit_; }

  bool isOpen() const noexcept { return !exit_.has_value(); }
  bool isClosed() const noexcept { return exit_.has_value(); }

  // Throws AlreadyExitedError if closed. An exit earlier than the entry is
  // clamped to the entry time.
  void close(Timestamp exit);

  // Throws TicketNotClosedError while open.
  Timestamp::duration duration() const;

  std::string to_string() const;

private:
  std::string ticketId_;
  Vehicle vehicle_;
  SpotId spot_;
  Timestamp entry_;
  std::optional<Timestamp> exit_;
};

} // namespace parkinglot
