#include "parkinglot/parking_service.hpp"

#include <mutex>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"

using namespace std;

namespace parkinglot {

void InMemoryReceiptLog::accept(const Receipt& receipt) {
  unique_lock lock(mtx_);
  auto [it, inserted] = receipts_.insert_or_assign(receipt.record.ticketId(), receipt);
  if (inserted) order_.push_back(it->first);
}

optional<Receipt> InMemoryReceiptLog::findByTicket(const string& ticketId) const {
  shared_lock lock(mtx_);
  auto it = receipts_.find(ticketId);
  if (it == receipts_.end()) return nullopt;
  return it->second;
}

vector<Receipt> InMemoryReceiptLog::all() const {
  shared_lock lock(mtx_);
  vector<Receipt> res;
  res.reserve(order_.size());
  for (auto& id : order_) res.push_back(receipts_.at(id));
  return res;
}

Money InMemoryReceiptLog::totalRevenue() const {
  shared_lock lock(mtx_);
  Money total = 0;
  for (auto& [_, r] : receipts_) total += r.fee.amount;
  return total;
}

ParkingService::ParkingService(ParkingFacility& facility, RateTable rates, ReceiptSink& sink)
  : facility_(facility), rates_(move(rates)), sink_(sink)
{
  rates_.validate();
}

OccupancyRecord ParkingService::checkIn(const Vehicle& v) {
  // Refuse vehicles that could never be billed.
  rates_.multiplierFor(v.vehicleClass());
  return facility_.parkVehicle(v);
}

void ParkingService::requireBillable(const optional<OccupancyRecord>& open, const string& key) const {
  if (!open) {
    throw VehicleNotFoundError(key);
  }
  rates_.multiplierFor(open->vehicle().vehicleClass());
}

Receipt ParkingService::checkOut(const Vehicle& v) {
  requireBillable(facility_.findOpenRecord(v.plate()), v.plate());
  return settle(facility_.unparkVehicle(v));
}

Receipt ParkingService::checkOutByTicket(const string& ticketId) {
  requireBillable(facility_.findOpenTicket(ticketId), ticketId);
  return settle(facility_.unparkByTicket(ticketId));
}

Fee ParkingService::quote(const string& plate, Timestamp now) const {
  auto open = facility_.findOpenRecord(plate);
  if (!open) {
    throw VehicleNotFoundError(plate);
  }
  OccupancyRecord preview = *open;
  preview.close(now);
  return calculator_.computeFee(preview, rates_);
}

Receipt ParkingService::settle(const OccupancyRecord& closed) {
  Receipt receipt{closed, calculator_.computeFee(closed, rates_)};
  try {
    sink_.accept(receipt);
  } catch (const exception& e) {
    Logger::error("Service", "ticket %s: receipt hand-off failed: %s", closed.ticketId().c_str(), e.what());
    throw ReceiptHandOffError(receipt, e.what());
  }
  Logger::info("Service", "ticket %s settled: %lld unit(s), amount %lld", closed.ticketId().c_str(),
               static_cast<long long>(receipt.fee.billedUnits), static_cast<long long>(receipt.fee.amount));
  return receipt;
}

} // namespace parkinglot
