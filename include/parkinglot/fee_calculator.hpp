#pragma once

#include <cstdint>

#include "parkinglot/config.hpp"
#include "parkinglot/occupancy_record.hpp"

namespace parkinglot {

struct Fee {
  std::int64_t billedUnits = 0;
  Money amount = 0;

  bool operator==(const Fee& o) const { return billedUnits == o.billedUnits && amount == o.amount; }
  bool operator!=(const Fee& o) const { return !(*this == o); }
};

/**
 * @brief Prices a closed ticket.
 *
 * Duration is rounded up to whole billing units (a one minute stay bills a
 * full unit), then charged at baseRate x class multiplier in minor units.
 * Charges that do not divide evenly by the percent multiplier round up.
 * The result depends only on the record and the table, so repeated calls
 * agree.
 */
class FeeCalculator {
public:
  // Throws TicketNotClosedError for an open record, ConfigurationError for
  // an invalid table or a vehicle class missing from it.
  Fee computeFee(const OccupancyRecord& record, const RateTable& rates) const;

  static std::int64_t billedUnits(Timestamp::duration stay, const RateTable& rates);

private:
  static Money charge(std::int64_t units, Money baseRate, std::int64_t percent);
};

} // namespace parkinglot
