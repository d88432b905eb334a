#include "parkinglot/occupancy_record.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"

using namespace std;

namespace parkinglot {

namespace {

string formatTime(Timestamp t) {
  auto tt = chrono::system_clock::to_time_t(t);
  tm utc{};
  gmtime_r(&tt, &utc);
  ostringstream oss;
  oss << put_time(&utc, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

} // namespace

OccupancyRecord::OccupancyRecord(string ticketId, Vehicle vehicle, SpotId spot, Timestamp entry)
  : ticketId_(move(ticketId)), vehicle_(move(vehicle)), spot_(spot), entry_(entry)
{
  if (ticketId_.empty()) {
    throw InvalidStateError("ticket id cannot be empty");
  }
}

void OccupancyRecord::close(Timestamp exit) {
  if (isClosed()) {
    throw AlreadyExitedError(ticketId_);
  }
  if (exit < entry_) {
    Logger::warn("Ticket", "%s: exit before entry, clamping to entry time", ticketId_.c_str());
    exit = entry_;
  }
  exit_ = exit;
}

Timestamp::duration OccupancyRecord::duration() const {
  if (isOpen()) {
    throw TicketNotClosedError(ticketId_);
  }
  return *exit_ - entry_;
}

string OccupancyRecord::to_string() const {
  ostringstream oss;
  oss << "Ticket{";
  oss << "id=" << ticketId_;
  oss << ", plate=" << vehicle_.plate();
  oss << ", class=" << vehicle_.vehicleClass();
  oss << ", spot=" << spot_;
  oss << ", entry=" << formatTime(entry_);
  if (exit_) oss << ", exit=" << formatTime(*exit_);
  oss << "}";
  return oss.str();
}

} // namespace parkinglot
