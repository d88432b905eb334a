#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "parkinglot/types.hpp"

namespace parkinglot {

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

/**
 * @brief Compile-time defaults
 */
namespace Config {
    namespace Billing {
        constexpr std::int64_t UNIT_MINUTES{60};
        constexpr Money BASE_RATE_MINOR{1'000};
        constexpr std::int64_t MINIMUM_UNITS{1};
        constexpr std::int64_t IDENTITY_MULTIPLIER_PERCENT{100};
        constexpr std::int64_t MINUTES_PER_DAY{24 * 60};
    }

    namespace Ticket {
        constexpr int SEQUENCE_WIDTH{6};
    }

    namespace Logging {
        constexpr LogLevel DEFAULT_LEVEL{LogLevel::INFO};
        constexpr const char *LEVEL_ENV_VAR{"PARKINGLOT_LOG_LEVEL"};
    }
}

// Case-insensitive "debug", "info", "warn", "error", "off".
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @brief Spot classes of one floor, in spot-number order (spot 1 first).
 */
struct FloorLayout {
  std::vector<SpotClass> spots;
};

/**
 * @brief Facility layout consumed once at construction.
 *
 * Floor i of the facility is floors[i - 1].
 */
struct FacilityConfig {
  std::vector<FloorLayout> floors;

  // `levels` identical floors; spots of each class are numbered in class order.
  static FacilityConfig uniform(int levels, const std::map<SpotClass, int>& spotClassCounts);

  int totalSpots() const;

  // Throws ConfigurationError on an empty facility or an empty floor.
  void validate() const;
};

/**
 * @brief Pricing data for FeeCalculator.
 *
 * Multipliers are percentages (100 = x1, 300 = x3) so all arithmetic stays
 * in integer minor units.
 */
struct RateTable {
  Money baseRate = Config::Billing::BASE_RATE_MINOR;
  std::chrono::minutes billingUnit{Config::Billing::UNIT_MINUTES};
  std::map<VehicleClass, std::int64_t> multiplierPercent;
  std::int64_t minimumUnits = Config::Billing::MINIMUM_UNITS;
  // Upper bound on the charge of each started 24 hour block.
  std::optional<Money> dailyCap;

  // Every built-in class at x1.
  static RateTable flat(Money baseRate, std::chrono::minutes unit = std::chrono::minutes(Config::Billing::UNIT_MINUTES));

  RateTable& withMultiplier(VehicleClass vc, std::int64_t percent);

  // Throws ConfigurationError when the class has no entry.
  std::int64_t multiplierFor(VehicleClass vc) const;

  void validate() const;
};

} // namespace parkinglot
