#pragma once

#include <stdexcept>
#include <string>

namespace parkinglot {

/**
 * @brief Base of every error the parking core reports.
 *
 * Each failure mode has its own type so callers can react to it separately
 * (e.g. redirect on FacilityFullError, show a lookup on VehicleNotFoundError).
 */
class ParkingError : public std::runtime_error {
public:
  explicit ParkingError(const std::string& message) : std::runtime_error(message) {}
};

// Vehicle already holds an open ticket.
class DuplicateEntryError : public ParkingError {
public:
  explicit DuplicateEntryError(const std::string& plate)
    : ParkingError("vehicle already parked: " + plate) {}
};

// No free compatible spot on any floor.
class FacilityFullError : public ParkingError {
public:
  explicit FacilityFullError(const std::string& plate)
    : ParkingError("no compatible free spot for vehicle: " + plate) {}
};

// Unpark requested for a plate or ticket with no open record.
class VehicleNotFoundError : public ParkingError {
public:
  explicit VehicleNotFoundError(const std::string& key)
    : ParkingError("no open ticket for: " + key) {}
};

class AlreadyExitedError : public ParkingError {
public:
  explicit AlreadyExitedError(const std::string& ticketId)
    : ParkingError("ticket already closed: " + ticketId) {}
};

class TicketNotClosedError : public ParkingError {
public:
  explicit TicketNotClosedError(const std::string& ticketId)
    : ParkingError("ticket still open: " + ticketId) {}
};

/**
 * @brief A spot assign/release precondition was violated.
 *
 * Signals a bug in the caller or the core, not a normal user error.
 */
class InvalidStateError : public ParkingError {
public:
  explicit InvalidStateError(const std::string& message) : ParkingError(message) {}
};

// Rejected facility layout, rate table or vehicle value.
class ConfigurationError : public ParkingError {
public:
  explicit ConfigurationError(const std::string& message) : ParkingError(message) {}
};

} // namespace parkinglot
