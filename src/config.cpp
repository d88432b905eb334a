#include "parkinglot/config.hpp"

#include <algorithm>
#include <cctype>

#include "parkinglot/errors.hpp"

using namespace std;

namespace parkinglot {

optional<LogLevel> parseLogLevel(const string& name) {
  string lower(name);
  transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });

  static const map<string, LogLevel> levels{
    {"debug", LogLevel::DEBUG},
    {"info",  LogLevel::INFO},
    {"warn",  LogLevel::WARN},
    {"error", LogLevel::ERROR},
    {"off",   LogLevel::OFF},
  };
  auto it = levels.find(lower);
  if (it == levels.end()) return nullopt;
  return it->second;
}

FacilityConfig FacilityConfig::uniform(int levels, const map<SpotClass, int>& spotClassCounts) {
  if (levels <= 0) {
    throw ConfigurationError("facility needs at least one floor");
  }
  FloorLayout layout;
  for (auto& [type, count] : spotClassCounts) {
    if (count < 0) {
      throw ConfigurationError(string("negative spot count for ") + toString(type));
    }
    layout.spots.insert(layout.spots.end(), static_cast<size_t>(count), type);
  }
  FacilityConfig cfg;
  cfg.floors.assign(static_cast<size_t>(levels), layout);
  return cfg;
}

int FacilityConfig::totalSpots() const {
  size_t total = 0;
  for (auto& f : floors) total += f.spots.size();
  return static_cast<int>(total);
}

void FacilityConfig::validate() const {
  if (floors.empty()) {
    throw ConfigurationError("facility needs at least one floor");
  }
  for (size_t i = 0; i < floors.size(); ++i) {
    if (floors[i].spots.empty()) {
      throw ConfigurationError("floor " + to_string(i + 1) + " has no spots");
    }
  }
}

RateTable RateTable::flat(Money baseRate, chrono::minutes unit) {
  RateTable table;
  table.baseRate = baseRate;
  table.billingUnit = unit;
  for (auto vc : {VehicleClass::Small, VehicleClass::Compact, VehicleClass::Large}) {
    table.multiplierPercent[vc] = Config::Billing::IDENTITY_MULTIPLIER_PERCENT;
  }
  return table;
}

RateTable& RateTable::withMultiplier(VehicleClass vc, int64_t percent) {
  multiplierPercent[vc] = percent;
  return *this;
}

int64_t RateTable::multiplierFor(VehicleClass vc) const {
  auto it = multiplierPercent.find(vc);
  if (it == multiplierPercent.end()) {
    throw ConfigurationError(string("no rate multiplier for vehicle class ") + toString(vc));
  }
  return it->second;
}

void RateTable::validate() const {
  if (baseRate <= 0) {
    throw ConfigurationError("base rate must be positive");
  }
  if (billingUnit.count() <= 0) {
    throw ConfigurationError("billing unit must be positive");
  }
  if (minimumUnits < 0) {
    throw ConfigurationError("minimum billed units cannot be negative");
  }
  if (dailyCap && *dailyCap <= 0) {
    throw ConfigurationError("daily cap must be positive");
  }
  for (auto& [vc, percent] : multiplierPercent) {
    if (percent < 0) {
      throw ConfigurationError(string("negative rate multiplier for vehicle class ") + toString(vc));
    }
  }
}

} // namespace parkinglot
