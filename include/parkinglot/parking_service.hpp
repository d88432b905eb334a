#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "parkinglot/errors.hpp"
#include "parkinglot/fee_calculator.hpp"
#include "parkinglot/parking_facility.hpp"

namespace parkinglot {

// A closed ticket and what it costs.
struct Receipt {
  OccupancyRecord record;
  Fee fee;
};

/**
 * @brief The sink refused a receipt after the vehicle already left.
 *
 * The facility has released the spot; the receipt travels with the error
 * so the caller can retry the hand-off.
 */
class ReceiptHandOffError : public ParkingError {
public:
  ReceiptHandOffError(Receipt receipt, const std::string& reason)
    : ParkingError("receipt hand-off failed for ticket " + receipt.record.ticketId() + ": " + reason)
    , receipt_(std::move(receipt)) {}

  const Receipt& receipt() const noexcept { return receipt_; }

private:
  Receipt receipt_;
};

/**
 * @brief Downstream collaborator (persistence, payment) that takes
 * ownership of finished receipts.
 */
class ReceiptSink {
public:
  virtual ~ReceiptSink() = default;
  virtual void accept(const Receipt& receipt) = 0;
};

/**
 * @brief In-memory sink; keeps every receipt it is handed.
 */
class InMemoryReceiptLog : public ReceiptSink {
public:
  void accept(const Receipt& receipt) override;

  std::optional<Receipt> findByTicket(const std::string& ticketId) const;
  std::vector<Receipt> all() const;
  Money totalRevenue() const;

private:
  std::map<std::string, Receipt> receipts_;
  std::vector<std::string> order_;
  mutable std::shared_mutex mtx_;
};

/**
 * @brief Entry and exit desk over one facility.
 *
 * checkOut unparks, prices the closed ticket and hands the receipt to the
 * sink. The facility and sink must outlive the service.
 */
class ParkingService {
public:
  ParkingService(ParkingFacility& facility, RateTable rates, ReceiptSink& sink);

  OccupancyRecord checkIn(const Vehicle& v);

  // Nothing is unparked unless the ticket can be priced. Throws
  // ReceiptHandOffError when the sink rejects the finished receipt.
  Receipt checkOut(const Vehicle& v);
  Receipt checkOutByTicket(const std::string& ticketId);

  // Price a stay without closing it, as if the vehicle left now.
  Fee quote(const std::string& plate, Timestamp now) const;

  const RateTable& rates() const noexcept { return rates_; }

private:
  void requireBillable(const std::optional<OccupancyRecord>& open, const std::string& key) const;
  Receipt settle(const OccupancyRecord& closed);

  ParkingFacility& facility_;
  RateTable rates_;
  FeeCalculator calculator_;
  ReceiptSink& sink_;
};

} // namespace parkinglot
