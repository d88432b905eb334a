#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "parkinglot/occupancy_record.hpp"

namespace parkinglot {

/**
 * @brief Open tickets, indexed by ticket id and by plate.
 *
 * Data access only; the one-open-ticket-per-plate rule is enforced by the
 * facility before save().
 */
class TicketRepository {
public:
  void save(const OccupancyRecord& r) {
    std::unique_lock lock(mtx_);
    tickets_.insert_or_assign(r.ticketId(), r);
    vehicleIndex_[r.vehicle().plate()] = r.ticketId();
  }

  std::optional<OccupancyRecord> findByVehicle(const std::string& plate) const {
    std::shared_lock lock(mtx_);
    auto it = vehicleIndex_.find(plate);
    if (it == vehicleIndex_.end()) return std::nullopt;
    return tickets_.at(it->second);
  }

  std::optional<OccupancyRecord> findByTicket(const std::string& ticketId) const {
    std::shared_lock lock(mtx_);
    auto it = tickets_.find(ticketId);
    if (it == tickets_.end()) return std::nullopt;
    return it->second;
  }

  void remove(const std::string& ticketId) {
    std::unique_lock lock(mtx_);
    auto it = tickets_.find(ticketId);
    if (it != tickets_.end()) {
      vehicleIndex_.erase(it->second.vehicle().plate());
      tickets_.erase(it);
    }
  }

  std::size_t size() const {
    std::shared_lock lock(mtx_);
    return tickets_.size();
  }

private:
  std::map<std::string, OccupancyRecord> tickets_;
  std::map<std::string, std::string> vehicleIndex_;
  mutable std::shared_mutex mtx_;
};

} // namespace parkinglot
