#include "mavlog/utils/uuid.hpp"

#include <uuid/uuid.h>

#include <algorithm>
#include <iterator>

namespace mavlog::utils {

core::Uuid generate_uuid() {
  uuid_t raw;
  uuid_generate_random(raw);
  core::Uuid out{};
  std::copy(std::begin(raw), std::end(raw), out.begin());
  return out;
}

std::string uuid_to_string(const core::Uuid& id) {
  uuid_t raw;
  std::copy(id.begin(), id.end(), std::begin(raw));
  char buf[37]{};
  uuid_unparse_lower(raw, buf);
  return std::string(buf);
}

} // namespace mavlog::utils
