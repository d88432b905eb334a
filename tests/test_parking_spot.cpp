/**
 * @file test_parking_spot.cpp
 * @brief Unit tests for ParkingSpot occupancy transitions
 */

#include <gtest/gtest.h>

#include <memory>

#include "parkinglot/errors.hpp"
#include "parkinglot/parking_spot.hpp"

namespace parkinglot {
namespace test {

class ParkingSpotTest : public ::testing::Test {
protected:
    std::shared_ptr<const SpotCompatibility> policy =
        std::make_shared<const SpotCompatibility>(SpotCompatibility::defaultPolicy());
    ParkingSpot carSpot{SpotId{1, 1}, SpotClass::Car, policy};
    Vehicle compact{"AB-123", VehicleClass::Compact};
    Vehicle truck{"TR-001", VehicleClass::Large};
};

TEST_F(ParkingSpotTest, StartsFree) {
    EXPECT_TRUE(carSpot.isFree());
    EXPECT_FALSE(carSpot.occupant().has_value());
    EXPECT_EQ(carSpot.id(), (SpotId{1, 1}));
    EXPECT_EQ(carSpot.spotClass(), SpotClass::Car);
}

TEST_F(ParkingSpotTest, AssignThenRelease) {
    ASSERT_TRUE(carSpot.canAccept(compact));
    carSpot.assign(compact);

    EXPECT_FALSE(carSpot.isFree());
    EXPECT_EQ(*carSpot.occupant(), compact);
    EXPECT_FALSE(carSpot.canAccept(Vehicle("CD-456", VehicleClass::Compact)));

    Vehicle released = carSpot.release();
    EXPECT_EQ(released, compact);
    EXPECT_TRUE(carSpot.isFree());
}

TEST_F(ParkingSpotTest, IncompatibleVehicleNeverAccepted) {
    EXPECT_FALSE(carSpot.canAccept(truck));
    carSpot.assign(compact);
    EXPECT_FALSE(carSpot.canAccept(truck));
}

TEST_F(ParkingSpotTest, AssignToOccupiedSpotThrowsAndKeepsOccupant) {
    carSpot.assign(compact);
    EXPECT_THROW(carSpot.assign(Vehicle("CD-456", VehicleClass::Compact)), InvalidStateError);
    EXPECT_EQ(carSpot.occupant()->plate(), "AB-123");
}

TEST_F(ParkingSpotTest, AssignIncompatibleThrowsAndStaysFree) {
    EXPECT_THROW(carSpot.assign(truck), InvalidStateError);
    EXPECT_TRUE(carSpot.isFree());
}

TEST_F(ParkingSpotTest, ReleaseFreeSpotThrows) {
    EXPECT_THROW(carSpot.release(), InvalidStateError);
}

TEST_F(ParkingSpotTest, NullPolicyRejected) {
    EXPECT_THROW(ParkingSpot(SpotId{1, 2}, SpotClass::Car, nullptr), ConfigurationError);
}

TEST(VehicleTest, EmptyPlateRejected) {
    EXPECT_THROW(Vehicle("", VehicleClass::Small), ConfigurationError);
}

} // namespace test
} // namespace parkinglot
