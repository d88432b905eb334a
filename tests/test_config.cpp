/**
 * @file test_config.cpp
 * @brief Unit tests for facility layouts, rate tables and log level parsing
 */

#include <gtest/gtest.h>

#include "parkinglot/config.hpp"
#include "parkinglot/errors.hpp"

namespace parkinglot {
namespace test {

TEST(FacilityConfigTest, UniformBuildsIdenticalFloorsInClassOrder) {
    auto cfg = FacilityConfig::uniform(3, {{SpotClass::Truck, 1}, {SpotClass::Bike, 2}, {SpotClass::Car, 3}});

    ASSERT_EQ(cfg.floors.size(), 3u);
    EXPECT_EQ(cfg.totalSpots(), 18);
    EXPECT_EQ(cfg.floors[0].spots,
              (std::vector<SpotClass>{SpotClass::Bike, SpotClass::Bike, SpotClass::Car,
                                      SpotClass::Car, SpotClass::Car, SpotClass::Truck}));
    EXPECT_EQ(cfg.floors[2].spots, cfg.floors[0].spots);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(FacilityConfigTest, RejectsEmptyFacilityAndFloors) {
    EXPECT_THROW(FacilityConfig::uniform(0, {{SpotClass::Car, 1}}), ConfigurationError);
    EXPECT_THROW(FacilityConfig::uniform(1, {{SpotClass::Car, -1}}), ConfigurationError);
    EXPECT_THROW(FacilityConfig{}.validate(), ConfigurationError);

    auto cfg = FacilityConfig::uniform(2, {});
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(RateTableTest, FlatTableCoversBuiltInClasses) {
    auto rates = RateTable::flat(250);
    EXPECT_EQ(rates.baseRate, 250);
    EXPECT_EQ(rates.billingUnit, std::chrono::minutes(60));
    EXPECT_EQ(rates.multiplierFor(VehicleClass::Small), 100);
    EXPECT_EQ(rates.multiplierFor(VehicleClass::Large), 100);
    EXPECT_NO_THROW(rates.validate());
}

TEST(RateTableTest, ValidateRejectsNonsense) {
    auto rates = RateTable::flat(100);
    rates.minimumUnits = -1;
    EXPECT_THROW(rates.validate(), ConfigurationError);

    rates = RateTable::flat(100);
    rates.dailyCap = 0;
    EXPECT_THROW(rates.validate(), ConfigurationError);

    rates = RateTable::flat(-5);
    EXPECT_THROW(rates.validate(), ConfigurationError);
}

TEST(RateTableTest, NegativeMultiplierRejected) {
    auto rates = RateTable::flat(10);
    rates.withMultiplier(VehicleClass::Compact, -1);
    EXPECT_EQ(rates.multiplierFor(VehicleClass::Compact), -1);
    EXPECT_THROW(rates.validate(), ConfigurationError);

    rates.withMultiplier(VehicleClass::Compact, 0);
    EXPECT_NO_THROW(rates.validate());
}

TEST(RateTableTest, MissingClassThrows) {
    RateTable empty;
    EXPECT_THROW(empty.multiplierFor(VehicleClass::Compact), ConfigurationError);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug").value(), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN").value(), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Off").value(), LogLevel::OFF);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

} // namespace test
} // namespace parkinglot
