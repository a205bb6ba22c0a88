#pragma once
#include "mavlog/core/types.hpp"

#include <string>

namespace mavlog::utils {

/**
 * @brief Random (version 4) UUID from libuuid.
 */
[[nodiscard]] core::Uuid generate_uuid();

// Canonical lowercase 8-4-4-4-12 form.
[[nodiscard]] std::string uuid_to_string(const core::Uuid& id);

} // namespace mavlog::utils
