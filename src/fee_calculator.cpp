#include "parkinglot/fee_calculator.hpp"

#include <algorithm>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"

using namespace std;

namespace parkinglot {

namespace {

int64_t ceilDiv(int64_t num, int64_t den) {
  return num / den + (num % den != 0 ? 1 : 0);
}

int64_t unitsIn(Timestamp::duration stay, Timestamp::duration unit) {
  if (stay.count() <= 0) return 0;
  return ceilDiv(stay.count(), unit.count());
}

} // namespace

int64_t FeeCalculator::billedUnits(Timestamp::duration stay, const RateTable& rates) {
  auto unit = chrono::duration_cast<Timestamp::duration>(rates.billingUnit);
  return max(unitsIn(stay, unit), rates.minimumUnits);
}

Money FeeCalculator::charge(int64_t units, Money baseRate, int64_t percent) {
  return ceilDiv(baseRate * units * percent, Config::Billing::IDENTITY_MULTIPLIER_PERCENT);
}

Fee FeeCalculator::computeFee(const OccupancyRecord& record, const RateTable& rates) const {
  if (record.isOpen()) {
    throw TicketNotClosedError(record.ticketId());
  }
  rates.validate();
  int64_t percent = rates.multiplierFor(record.vehicle().vehicleClass());

  auto stay = record.duration();
  Fee fee;
  fee.billedUnits = billedUnits(stay, rates);

  if (!rates.dailyCap) {
    fee.amount = charge(fee.billedUnits, rates.baseRate, percent);
  } else {
    // Each started 24h block is charged separately and capped.
    auto unit = chrono::duration_cast<Timestamp::duration>(rates.billingUnit);
    auto day = chrono::duration_cast<Timestamp::duration>(chrono::minutes(Config::Billing::MINUTES_PER_DAY));
    int64_t fullDays = stay.count() > 0 ? stay / day : 0;
    int64_t remUnits = unitsIn(stay - fullDays * day, unit);
    if (fullDays == 0) remUnits = max(remUnits, rates.minimumUnits);

    Money perDay = min(charge(unitsIn(day, unit), rates.baseRate, percent), *rates.dailyCap);
    fee.amount = fullDays * perDay + min(charge(remUnits, rates.baseRate, percent), *rates.dailyCap);
  }

  Logger::debug("Fee", "%s: %lld unit(s) x%lld%% = %lld", record.ticketId().c_str(),
                static_cast<long long>(fee.billedUnits), static_cast<long long>(percent),
                static_cast<long long>(fee.amount));
  return fee;
}

} // namespace parkinglot
