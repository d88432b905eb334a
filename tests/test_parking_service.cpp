/**
 * @file test_parking_service.cpp
 * @brief Unit tests for the check-in / check-out desk and receipt hand-off
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "parkinglot/errors.hpp"
#include "parkinglot/logger.hpp"
#include "parkinglot/parking_service.hpp"

namespace parkinglot {
namespace test {

using namespace std::chrono_literals;

// Records every receipt it is handed, in order.
class CapturingSink : public ReceiptSink {
public:
    void accept(const Receipt& receipt) override { received.push_back(receipt); }
    std::vector<Receipt> received;
};

// Refuses every receipt, like a payment backend that is down.
class RefusingSink : public ReceiptSink {
public:
    void accept(const Receipt&) override { throw std::runtime_error("ledger offline"); }
};

class ParkingServiceTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::OFF); }
    void TearDown() override { Logger::setLevel(Config::Logging::DEFAULT_LEVEL); }

    static RateTable tenPerHour() {
        RateTable rates = RateTable::flat(10);
        rates.withMultiplier(VehicleClass::Large, 300);
        return rates;
    }

    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(Timestamp{} + 9h);
    ParkingFacility facility{FacilityConfig::uniform(1, {{SpotClass::Car, 2}, {SpotClass::Truck, 1}}), clock};
    CapturingSink sink;
};

TEST_F(ParkingServiceTest, TruckCheckOutAfterFiveMinutesCostsThirty) {
    ParkingService svc(facility, tenPerHour(), sink);
    Vehicle truck("TR-001", VehicleClass::Large);

    svc.checkIn(truck);
    clock->advance(5min);
    Receipt receipt = svc.checkOut(truck);

    EXPECT_EQ(receipt.fee.billedUnits, 1);
    EXPECT_EQ(receipt.fee.amount, 30);
    EXPECT_TRUE(receipt.record.isClosed());
    ASSERT_EQ(sink.received.size(), 1u);
    EXPECT_EQ(sink.received[0].record.ticketId(), receipt.record.ticketId());
    EXPECT_EQ(sink.received[0].fee, receipt.fee);
}

TEST_F(ParkingServiceTest, CheckOutByTicket) {
    ParkingService svc(facility, tenPerHour(), sink);
    auto ticket = svc.checkIn(Vehicle("AB-123", VehicleClass::Compact));
    clock->advance(2h + 1min);

    Receipt receipt = svc.checkOutByTicket(ticket.ticketId());
    EXPECT_EQ(receipt.fee.billedUnits, 3);
    EXPECT_EQ(receipt.fee.amount, 30);
    EXPECT_TRUE(facility.spot(ticket.spot()).isFree());
}

TEST_F(ParkingServiceTest, FailedCheckOutHandsNothingToSink) {
    ParkingService svc(facility, tenPerHour(), sink);
    EXPECT_THROW(svc.checkOut(Vehicle("ZZ-000", VehicleClass::Compact)), VehicleNotFoundError);
    EXPECT_TRUE(sink.received.empty());
}

TEST_F(ParkingServiceTest, QuoteLeavesTicketOpen) {
    ParkingService svc(facility, tenPerHour(), sink);
    svc.checkIn(Vehicle("AB-123", VehicleClass::Compact));

    Fee quoted = svc.quote("AB-123", clock->now() + 90min);
    EXPECT_EQ(quoted.billedUnits, 2);
    EXPECT_EQ(quoted.amount, 20);
    EXPECT_TRUE(facility.findOpenRecord("AB-123").has_value());
    EXPECT_THROW(svc.quote("ZZ-000", clock->now()), VehicleNotFoundError);
}

TEST_F(ParkingServiceTest, UnbillableClassRefusedAtCheckIn) {
    RateTable carsOnly;
    carsOnly.baseRate = 10;
    carsOnly.withMultiplier(VehicleClass::Compact, 100);
    ParkingService svc(facility, carsOnly, sink);

    EXPECT_THROW(svc.checkIn(Vehicle("TR-001", VehicleClass::Large)), ConfigurationError);
    EXPECT_EQ(facility.openTicketCount(), 0u);
}

TEST_F(ParkingServiceTest, UnbillableClassParkedDirectlyStaysParkedOnCheckOut) {
    RateTable noTrucks = tenPerHour();
    noTrucks.multiplierPercent.erase(VehicleClass::Large);
    ParkingService svc(facility, noTrucks, sink);
    Vehicle truck("TR-001", VehicleClass::Large);
    auto ticket = facility.parkVehicle(truck);

    EXPECT_THROW(svc.checkOut(truck), ConfigurationError);
    EXPECT_THROW(svc.checkOutByTicket(ticket.ticketId()), ConfigurationError);

    EXPECT_EQ(facility.openTicketCount(), 1u);
    EXPECT_TRUE(facility.findOpenRecord("TR-001").has_value());
    EXPECT_FALSE(facility.spot(ticket.spot()).isFree());
    EXPECT_TRUE(sink.received.empty());
}

TEST_F(ParkingServiceTest, RefusedReceiptTravelsWithTheError) {
    RefusingSink refusing;
    ParkingService svc(facility, tenPerHour(), refusing);
    Vehicle truck("TR-001", VehicleClass::Large);
    auto ticket = svc.checkIn(truck);
    clock->advance(5min);

    try {
        svc.checkOut(truck);
        FAIL() << "expected ReceiptHandOffError";
    } catch (const ReceiptHandOffError& e) {
        EXPECT_EQ(e.receipt().record.ticketId(), ticket.ticketId());
        EXPECT_TRUE(e.receipt().record.isClosed());
        EXPECT_EQ(e.receipt().fee.amount, 30);
    }
    EXPECT_TRUE(facility.spot(ticket.spot()).isFree());
    EXPECT_EQ(facility.openTicketCount(), 0u);
}

TEST_F(ParkingServiceTest, InvalidRatesRejectedAtConstruction) {
    RateTable bad = tenPerHour();
    bad.billingUnit = std::chrono::minutes(0);
    EXPECT_THROW({ ParkingService svc(facility, bad, sink); }, ConfigurationError);
}

TEST(InMemoryReceiptLogTest, KeepsReceiptsInArrivalOrder) {
    InMemoryReceiptLog log;
    Timestamp t0 = Timestamp{} + 8h;

    OccupancyRecord first("000001-a", Vehicle("A-1", VehicleClass::Compact), SpotId{1, 1}, t0);
    first.close(t0 + 1h);
    OccupancyRecord second("000002-b", Vehicle("B-1", VehicleClass::Compact), SpotId{1, 2}, t0);
    second.close(t0 + 2h);

    log.accept(Receipt{first, Fee{1, 10}});
    log.accept(Receipt{second, Fee{2, 20}});

    auto all = log.all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].record.ticketId(), "000001-a");
    EXPECT_EQ(all[1].record.ticketId(), "000002-b");
    EXPECT_EQ(log.totalRevenue(), 30);

    auto found = log.findByTicket("000002-b");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->fee.amount, 20);
    EXPECT_FALSE(log.findByTicket("missing").has_value());
}

} // namespace test
} // namespace parkinglot
