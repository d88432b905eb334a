#include "parkinglot/ticket_id.hpp"

#include <iomanip>
#include <sstream>

#include <uuid/uuid.h>

#include "parkinglot/config.hpp"

using namespace std;

namespace parkinglot {

string TicketIdGenerator::next() {
  uint64_t seq = next_.fetch_add(1);
  issued_.fetch_add(1);

  ostringstream oss;
  oss << setw(Config::Ticket::SEQUENCE_WIDTH) << setfill('0') << seq << "-" << newUUID();
  return oss.str();
}

string TicketIdGenerator::newUUID() {
  uuid_t u; uuid_generate(u);
  char buf[37]; uuid_unparse(u, buf);
  return string{buf};
}

} // namespace parkinglot
