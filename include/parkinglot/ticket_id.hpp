#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace parkinglot {

/**
 * @brief Issues ticket ids of the form "<sequence>-<uuid>".
 *
 * The sequence alone keeps ids unique within one generator, whatever the
 * clock resolution; the UUID keeps them apart across restarts.
 */
class TicketIdGenerator {
public:
  explicit TicketIdGenerator(std::uint64_t firstSequence = 1) : next_(firstSequence) {}

  std::string next();

  std::uint64_t issued() const noexcept { return issued_.load(); }

private:
  static std::string newUUID();

  std::atomic<std::uint64_t> next_;
  std::atomic<std::uint64_t> issued_{0};
};

} // namespace parkinglot
